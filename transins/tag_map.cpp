//
//  Copyright(C) 2020 transins developers
//

#include "tag_map.hpp"
#include "tag.hpp"
#include "error.hpp"

namespace transins
{
  void TagMap::assign(const tokens_type& tokens)
  {
    clear();
    
    tokens_type stack;
    
    tokens_type::const_iterator titer_end = tokens.end();
    for (tokens_type::const_iterator titer = tokens.begin(); titer != titer_end; ++ titer) {
      const Tag tag(*titer);
      
      if (tag.kind() == Tag::OPENING)
	stack.push_back(*titer);
      else if (tag.kind() == Tag::CLOSING) {
	if (stack.empty())
	  throw MarkupInconsistency("no opening tag for " + Tag::readable(*titer) + " in: " + readable(tokens));
	
	put(stack.back(), *titer);
	stack.pop_back();
      }
    }
    
    if (! stack.empty())
      throw MarkupInconsistency("no closing tag for " + Tag::readable(stack.back()) + " in: " + readable(tokens));
  }
  
  void TagMap::put(const token_type& opening, const token_type& closing)
  {
    __pairs.push_back(value_type(opening, closing));
    __closing[opening] = closing;
    __opening[closing] = opening;
  }
  
  const token_type& TagMap::find(const map_type& map, const token_type& tag)
  {
    static const token_type __empty;
    
    map_type::const_iterator iter = map.find(tag);
    return (iter != map.end() ? iter->second : __empty);
  }
};
