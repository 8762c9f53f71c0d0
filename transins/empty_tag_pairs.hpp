// -*- mode: c++ -*-
//
//  Copyright(C) 2020 transins developers
//

#ifndef __TRANSINS__EMPTY_TAG_PAIRS__HPP__
#define __TRANSINS__EMPTY_TAG_PAIRS__HPP__ 1

#include <map>

#include <transins/tokens.hpp>
#include <transins/tag_map.hpp>

namespace transins
{
  // A tag pair enclosing nothing but tags is replaced by a synthetic
  // isolated tag, so that it is placed as one unit. restore() expands
  // the isolated tags back.
  
  class EmptyTagPairs
  {
  private:
    typedef std::map<token_type, tokens_type, std::less<token_type>,
		     std::allocator<std::pair<const token_type, tokens_type> > > replacement_map_type;
    
  public:
    typedef replacement_map_type::const_iterator const_iterator;
    
  public:
    // new isolated tags are numbered after the largest id in tokens
    void substitute(const tokens_type& tokens, const TagMap& tag_map, tokens_type& substituted);
    void restore(const tokens_type& tokens, tokens_type& restored) const;
    
    const_iterator begin() const { return __replacements.begin(); }
    const_iterator end() const { return __replacements.end(); }
    
    bool empty() const { return __replacements.empty(); }
    void clear() { __replacements.clear(); }
    
  private:
    replacement_map_type __replacements;
  };
};

#endif
