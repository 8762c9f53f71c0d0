//
//  Copyright(C) 2020 transins developers
//

#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include "alignment_table.hpp"

#include "utils/compress_stream.hpp"

namespace transins
{
  void AlignmentTable::read(const path_type& path)
  {
    utils::compress_istream is(path, 1024 * 1024);
    
    read(is);
  }
  
  void AlignmentTable::read(std::istream& is)
  {
    std::string block[3];
    int         filled = 0;
    
    std::string line;
    while (std::getline(is, line)) {
      boost::algorithm::trim(line);
      
      if (line.empty() || boost::algorithm::starts_with(line, "###")) continue;
      
      block[filled].swap(line);
      ++ filled;
      
      if (filled == 3) {
	__alignments[key_type(block[0], block[1])].swap(block[2]);
	filled = 0;
      }
    }
  }
  
  bool AlignmentTable::find(const std::string& source, const std::string& translation, std::string& alignment) const
  {
    alignment_map_type::const_iterator iter = __alignments.find(key_type(boost::algorithm::trim_copy(source),
									  boost::algorithm::trim_copy(translation)));
    if (iter == __alignments.end())
      return false;
    
    alignment = iter->second;
    return true;
  }
  
  void AlignmentTable::insert(const std::string& source, const std::string& translation, const std::string& alignment)
  {
    __alignments[key_type(boost::algorithm::trim_copy(source), boost::algorithm::trim_copy(translation))] = alignment;
  }
};
