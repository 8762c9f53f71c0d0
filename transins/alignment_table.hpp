// -*- mode: c++ -*-
//
//  Copyright(C) 2020 transins developers
//

#ifndef __TRANSINS__ALIGNMENT_TABLE__HPP__
#define __TRANSINS__ALIGNMENT_TABLE__HPP__ 1

// manually annotated alignments, looked up by source sentence and
// translation. the file consists of blocks of three lines: the source
// sentence, the translation and the alignment. blank lines and lines
// starting with ### are ignored.

#include <iostream>
#include <string>
#include <map>
#include <utility>

#include <boost/filesystem/path.hpp>

namespace transins
{
  class AlignmentTable
  {
  public:
    typedef boost::filesystem::path path_type;
    typedef size_t                  size_type;
    
  private:
    typedef std::pair<std::string, std::string> key_type;
    typedef std::map<key_type, std::string, std::less<key_type>,
		     std::allocator<std::pair<const key_type, std::string> > > alignment_map_type;
    
  public:
    AlignmentTable() {}
    explicit AlignmentTable(const path_type& path) { read(path); }
    
  public:
    void read(const path_type& path);
    void read(std::istream& is);
    
    // blanks around source and translation are ignored
    bool find(const std::string& source, const std::string& translation, std::string& alignment) const;
    
    void insert(const std::string& source, const std::string& translation, const std::string& alignment);
    
    size_type size() const { return __alignments.size(); }
    bool empty() const { return __alignments.empty(); }
    void clear() { __alignments.clear(); }
    
  private:
    alignment_map_type __alignments;
  };
};

#endif
