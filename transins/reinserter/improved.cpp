//
//  Copyright(C) 2020 transins developers
//

#include <algorithm>
#include <set>

#include "improved.hpp"
#include "pointed.hpp"

#include "transins/tag.hpp"

namespace transins
{
  namespace reinserter
  {
    void Improved::index(const SplitSentence& sentence,
			 const TagMap& tag_map,
			 const Alignment& alignment,
			 TagIndex& index,
			 tokens_type& unused) const
    {
      index.assign(sentence.tokens_without_tags.size());
      
      int offset = 0;
      for (int i = 0; i != static_cast<int>(sentence.tokens.size()); ++ i)
	if (Tag::is_tag(sentence.tokens[i])) {
	  const int pos = (Tag::is_backward(sentence.tokens[i]) ? i - offset - 1 : i - offset);
	  
	  index[std::max(pos, 0)].push_back(sentence.tokens[i]);
	  ++ offset;
	}
      
      move_to_pointed(index, tag_map, alignment.pointed(), unused);
    }
    
    void Improved::reinsert(const SplitSentence& sentence,
			    TagIndex& index,
			    const tokens_type& target,
			    const Alignment& alignment,
			    tokens_type& output) const
    {
      typedef Alignment::index_set_type index_set_type;
      typedef std::set<token_type, std::less<token_type>, std::allocator<token_type> > used_set_type;
      
      output = sentence.beginning;
      
      used_set_type used;
      tokens_type tags;
      
      // one past the last target token is the end of sentence
      for (index_type trg = 0; trg <= index_type(target.size()); ++ trg) {
	tokens_type before;
	tokens_type after;
	
	const index_set_type sources = alignment.source_indexes(trg);
	
	index_set_type::const_iterator siter_end = sources.end();
	for (index_set_type::const_iterator siter = sources.begin(); siter != siter_end; ++ siter) {
	  source_tags(*siter, index, sentence.tokens_without_tags, tags);
	  
	  tokens_type::const_iterator titer_end = tags.end();
	  for (tokens_type::const_iterator titer = tags.begin(); titer != titer_end; ++ titer) {
	    if (Tag::is_backward(*titer))
	      after.push_back(*titer);
	    else if (! Tag::is_isolated(*titer) || used.insert(*titer).second)
	      before.push_back(*titer);
	  }
	}
	
	output.insert(output.end(), before.begin(), before.end());
	if (trg != index_type(target.size()))
	  output.push_back(target[trg]);
	output.insert(output.end(), after.begin(), after.end());
      }
      
      output.insert(output.end(), sentence.end.begin(), sentence.end.end());
    }
    
    void Improved::source_tags(const index_type pos,
			       const TagIndex& index,
			       const tokens_type& words,
			       tokens_type& tags)
    {
      tags.clear();
      
      const index_type size = words.size();
      
      if (! index.valid(pos) || pos > size) return;
      
      if (pos == size) {
	tags = index[pos];
	return;
      }
      
      index_type first = -1;
      if (is_fragment(words[pos]))
	first = pos;
      else if (pos > 0 && is_fragment(words[pos - 1]))
	first = pos - 1;
      
      if (first < 0) {
	tags = index[pos];
	return;
      }
      
      while (first > 0 && is_fragment(words[first - 1]))
	-- first;
      
      for (index_type i = first; i < size; ++ i) {
	tags.insert(tags.end(), index[i].begin(), index[i].end());
	
	if (! is_fragment(words[i])) break;
      }
    }
  };
};
