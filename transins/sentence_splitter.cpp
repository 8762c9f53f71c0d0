//
//  Copyright(C) 2020 transins developers
//

#include <algorithm>

#include "sentence_splitter.hpp"
#include "tag.hpp"

namespace transins
{
  namespace impl
  {
    inline
    bool contains(const tokens_type& tokens, const token_type& token)
    {
      return std::find(tokens.begin(), tokens.end(), token) != tokens.end();
    }
    
    inline
    void erase(tokens_type& tokens, const token_type& token)
    {
      tokens_type::iterator iter = std::find(tokens.begin(), tokens.end(), token);
      if (iter != tokens.end())
	tokens.erase(iter);
    }
  };
  
  void SentenceSplitter::operator()(const tokens_type& tokens, const TagMap& tag_map, sentence_type& split) const
  {
    split.clear();
    
    tokens_type::const_iterator first = tokens.begin();
    while (first != tokens.end() && Tag::is_tag(*first))
      ++ first;
    
    // only tags: keep them all at the beginning
    if (first == tokens.end()) {
      split.beginning = tokens;
      return;
    }
    
    tokens_type::const_iterator last = tokens.end();
    while (last != first && Tag::is_tag(*(last - 1)))
      -- last;
    
    split.beginning.assign(tokens.begin(), first);
    split.end.assign(last, tokens.end());
    
    tokens_type closings;
    
    const tokens_type beginning = split.beginning;
    tokens_type::const_iterator biter_end = beginning.end();
    for (tokens_type::const_iterator biter = beginning.begin(); biter != biter_end; ++ biter)
      if (Tag::is_opening(*biter)) {
	const token_type& closing = tag_map.closing(*biter);
	
	if (impl::contains(split.end, closing))
	  closings.push_back(closing);
	else if (! impl::contains(split.beginning, closing))
	  impl::erase(split.beginning, *biter);
      }
    
    const tokens_type end = split.end;
    tokens_type::const_iterator eiter_end = end.end();
    for (tokens_type::const_iterator eiter = end.begin(); eiter != eiter_end; ++ eiter)
      if (Tag::is_closing(*eiter)
	  && ! impl::contains(closings, *eiter)
	  && ! impl::contains(split.end, tag_map.opening(*eiter)))
	impl::erase(split.end, *eiter);
    
    tokens_type::const_iterator titer_end = tokens.end();
    for (tokens_type::const_iterator titer = tokens.begin(); titer != titer_end; ++ titer) {
      if (titer < first && impl::contains(split.beginning, *titer)) continue;
      if (titer >= last && impl::contains(split.end, *titer)) continue;
      
      split.tokens.push_back(*titer);
    }
    
    remove_tags(split.tokens, split.tokens_without_tags);
  }
};
