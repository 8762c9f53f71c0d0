// -*- mode: c++ -*-
//
//  Copyright(C) 2020 transins developers
//

#ifndef __TRANSINS__TAG_INDEX__HPP__
#define __TRANSINS__TAG_INDEX__HPP__ 1

#include <vector>

#include <transins/tokens.hpp>
#include <transins/alignment.hpp>

namespace transins
{
  // tags assigned to source token indexes. slot i holds the tags of the
  // i-th content token, the last slot those behind the last content
  // token. consumed slots are not available any more.
  
  class TagIndex
  {
  public:
    typedef Alignment::index_type index_type;
    typedef size_t                size_type;
    
    typedef tokens_type tag_set_type;
    
  private:
    typedef std::vector<tag_set_type, std::allocator<tag_set_type> > tag_map_type;
    typedef std::vector<bool, std::allocator<bool> >                 consumed_type;
    
  public:
    TagIndex() {}
    // slots for size content tokens plus the end of sentence
    explicit TagIndex(const size_type size) { assign(size); }
    
  public:
    void assign(const size_type size)
    {
      __tags.clear();
      __tags.resize(size + 1);
      __consumed.clear();
      __consumed.resize(size + 1, false);
    }
    
    // number of slots
    size_type size() const { return __tags.size(); }
    
    // the slot of the end of sentence
    index_type eos() const { return index_type(__tags.size()) - 1; }
    
    bool valid(const index_type pos) const { return 0 <= pos && pos < index_type(__tags.size()); }
    
    tag_set_type& operator[](const index_type pos) { return __tags[pos]; }
    const tag_set_type& operator[](const index_type pos) const { return __tags[pos]; }
    
    bool consumed(const index_type pos) const { return __consumed[pos]; }
    
    bool empty(const index_type pos) const { return __consumed[pos] || __tags[pos].empty(); }
    
    // hand over the tags at pos
    const tag_set_type& consume(const index_type pos)
    {
      __consumed[pos] = true;
      return __tags[pos];
    }
    
  private:
    tag_map_type  __tags;
    consumed_type __consumed;
  };
};

#endif
