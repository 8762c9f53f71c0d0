//
//  Copyright(C) 2020 transins developers
//

#include <algorithm>

#include "empty_tag_pairs.hpp"
#include "tag.hpp"

namespace transins
{
  void EmptyTagPairs::substitute(const tokens_type& tokens, const TagMap& tag_map, tokens_type& substituted)
  {
    __replacements.clear();
    substituted.clear();
    
    Tag::id_type id_max = -1;
    tokens_type::const_iterator titer_end = tokens.end();
    for (tokens_type::const_iterator titer = tokens.begin(); titer != titer_end; ++ titer)
      id_max = std::max(id_max, Tag(*titer).id());
    
    Tag::id_type id = id_max + 1;
    for (size_t i = 0; i != tokens.size(); ++ i) {
      if (! Tag::is_opening(tokens[i])) {
	substituted.push_back(tokens[i]);
	continue;
      }
      
      const token_type& closing = tag_map.closing(tokens[i]);
      
      size_t last = i + 1;
      while (last != tokens.size() && Tag::is_tag(tokens[last]) && tokens[last] != closing)
	++ last;
      
      if (last == tokens.size() || tokens[last] != closing) {
	substituted.push_back(tokens[i]);
	continue;
      }
      
      const token_type isolated = Tag::isolated(id ++);
      
      substituted.push_back(isolated);
      __replacements[isolated] = tokens_type(tokens.begin() + i, tokens.begin() + last + 1);
      
      i = last;
    }
  }
  
  void EmptyTagPairs::restore(const tokens_type& tokens, tokens_type& restored) const
  {
    restored.clear();
    
    tokens_type::const_iterator titer_end = tokens.end();
    for (tokens_type::const_iterator titer = tokens.begin(); titer != titer_end; ++ titer) {
      replacement_map_type::const_iterator riter = (Tag::is_isolated(*titer)
						    ? __replacements.find(*titer)
						    : __replacements.end());
      
      if (riter != __replacements.end())
	restored.insert(restored.end(), riter->second.begin(), riter->second.end());
      else
	restored.push_back(*titer);
    }
  }
};
