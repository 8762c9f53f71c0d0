//
//  Copyright(C) 2020 transins developers
//

#include <algorithm>

#include "complete_mapping.hpp"
#include "pointed.hpp"

#include "transins/tag.hpp"

namespace transins
{
  namespace reinserter
  {
    namespace impl
    {
      inline
      void insert_unique(tokens_type& tokens, const token_type& token)
      {
	if (std::find(tokens.begin(), tokens.end(), token) == tokens.end())
	  tokens.push_back(token);
      }
      
      inline
      void intersect(tokens_type& tokens, const tokens_type& other)
      {
	tokens_type kept;
	
	tokens_type::const_iterator titer_end = tokens.end();
	for (tokens_type::const_iterator titer = tokens.begin(); titer != titer_end; ++ titer)
	  if (std::find(other.begin(), other.end(), *titer) != other.end())
	    kept.push_back(*titer);
	
	tokens.swap(kept);
      }
    };
    
    void CompleteMapping::neighbor_type::intersect(const neighbor_type& x)
    {
      impl::intersect(before, x.before);
      impl::intersect(after, x.after);
    }
    
    void CompleteMapping::index(const SplitSentence& sentence,
				const TagMap& tag_map,
				const Alignment& alignment,
				TagIndex& index,
				tokens_type& unused) const
    {
      index.assign(sentence.tokens_without_tags.size());
      
      tokens_type stack;
      
      int offset = 0;
      for (int i = 0; i != static_cast<int>(sentence.tokens.size()); ++ i) {
	const token_type& token = sentence.tokens[i];
	const Tag tag(token);
	
	if (tag.kind() == Tag::OPENING || tag.kind() == Tag::ISOLATED) {
	  stack.push_back(token);
	  ++ offset;
	} else if (tag.kind() == Tag::CLOSING) {
	  tokens_type::iterator siter = std::find(stack.begin(), stack.end(), tag_map.opening(token));
	  if (siter != stack.end())
	    stack.erase(siter);
	  ++ offset;
	} else if (! stack.empty()) {
	  tokens_type& tags = index[i - offset];
	  
	  tags.insert(tags.end(), stack.begin(), stack.end());
	  
	  // isolated tags are assigned to one token only
	  const tokens_type opened(stack.rbegin(), stack.rend());
	  
	  tokens_type::const_iterator oiter_end = opened.end();
	  for (tokens_type::const_iterator oiter = opened.begin(); oiter != oiter_end; ++ oiter) {
	    if (Tag::is_isolated(*oiter))
	      stack.erase(std::find(stack.begin(), stack.end(), *oiter));
	    else
	      tags.push_back(tag_map.closing(*oiter));
	  }
	}
      }
      
      move_isolated_to_pointed(index, alignment.pointed(), unused);
    }
    
    void CompleteMapping::reinsert(const SplitSentence& sentence,
				   TagIndex& index,
				   const tokens_type& target,
				   const Alignment& alignment,
				   tokens_type& output) const
    {
      typedef Alignment::index_set_type index_set_type;
      
      output = sentence.beginning;
      
      used_set_type used;
      
      const index_type length = target.size() + 1;
      const index_type source_eos = sentence.tokens_without_tags.size();
      
      for (index_type trg = 0; trg != length; ++ trg) {
	index_set_type sources = alignment.source_indexes(trg);
	
	// alignment to the end of the source counts as no alignment
	index_set_type::iterator eiter = std::find(sources.begin(), sources.end(), source_eos);
	if (eiter != sources.end())
	  sources.erase(eiter);
	
	neighbor_type neighbor = neighbors(sources, index, &used);
	
	if ((sources.empty() || neighbor.empty()) && trg < length - 1 && __max_gap_size > 0)
	  neighbor = (sources.empty()
		      ? interpolate_unaligned(trg, length, alignment, index)
		      : interpolate_untagged(trg, length, alignment, index));
	
	if (trg == length - 1) {
	  // only isolated tags apply to the end of sentence
	  tokens_type::const_iterator biter_end = neighbor.before.end();
	  for (tokens_type::const_iterator biter = neighbor.before.begin(); biter != biter_end; ++ biter)
	    if (Tag::is_isolated(*biter))
	      output.push_back(*biter);
	  
	  tokens_type::const_iterator aiter_end = neighbor.after.end();
	  for (tokens_type::const_iterator aiter = neighbor.after.begin(); aiter != aiter_end; ++ aiter)
	    if (Tag::is_isolated(*aiter))
	      output.push_back(*aiter);
	} else {
	  output.insert(output.end(), neighbor.before.begin(), neighbor.before.end());
	  output.push_back(target[trg]);
	  output.insert(output.end(), neighbor.after.begin(), neighbor.after.end());
	}
      }
      
      output.insert(output.end(), sentence.end.begin(), sentence.end.end());
    }
    
    CompleteMapping::neighbor_type CompleteMapping::neighbors(const Alignment::index_set_type& sources,
							      const TagIndex& index,
							      used_set_type* used)
    {
      neighbor_type neighbor;
      
      Alignment::index_set_type::const_iterator siter_end = sources.end();
      for (Alignment::index_set_type::const_iterator siter = sources.begin(); siter != siter_end; ++ siter) {
	if (! index.valid(*siter)) continue;
	
	const tokens_type& tags = index[*siter];
	
	tokens_type::const_iterator titer_end = tags.end();
	for (tokens_type::const_iterator titer = tags.begin(); titer != titer_end; ++ titer) {
	  if (Tag::is_backward(*titer))
	    impl::insert_unique(neighbor.after, *titer);
	  else if (! Tag::is_isolated(*titer))
	    impl::insert_unique(neighbor.before, *titer);
	  else if (used && used->insert(*titer).second)
	    impl::insert_unique(neighbor.before, *titer);
	}
      }
      
      return neighbor;
    }
    
    CompleteMapping::neighbor_type CompleteMapping::interpolate_unaligned(const index_type target,
									  const index_type length,
									  const Alignment& alignment,
									  const TagIndex& index) const
    {
      typedef Alignment::index_set_type index_set_type;
      
      index_type prev = -1;
      index_type next = -1;
      index_set_type sources_prev;
      index_set_type sources_next;
      
      for (index_type trg = target - 1; trg >= 0 && prev < 0; -- trg) {
	sources_prev = alignment.source_indexes(trg);
	if (! sources_prev.empty())
	  prev = trg;
      }
      
      // the end of sentence marker is not searched
      for (index_type trg = target + 1; trg < length - 1 && next < 0; ++ trg) {
	sources_next = alignment.source_indexes(trg);
	if (! sources_next.empty())
	  next = trg;
      }
      
      neighbor_type neighbor;
      
      if (prev < 0 && next < 0)
	;
      else if (prev < 0 && next <= __max_gap_size)
	neighbor = neighbors(sources_next, index, 0);
      else if (next < 0 && length - prev - 2 <= __max_gap_size)
	neighbor = neighbors(sources_prev, index, 0);
      else if (prev >= 0 && next >= 0 && next - prev - 1 <= __max_gap_size) {
	neighbor = neighbors(sources_prev, index, 0);
	neighbor.intersect(neighbors(sources_next, index, 0));
      }
      
      if (neighbor.empty())
	return interpolate_untagged(target, length, alignment, index);
      
      return neighbor;
    }
    
    CompleteMapping::neighbor_type CompleteMapping::interpolate_untagged(const index_type target,
									 const index_type length,
									 const Alignment& alignment,
									 const TagIndex& index) const
    {
      index_type prev = -1;
      index_type next = -1;
      neighbor_type neighbor_prev;
      neighbor_type neighbor_next;
      
      for (index_type trg = target - 1; trg >= 0 && prev < 0; -- trg) {
	neighbor_prev = neighbors(alignment.source_indexes(trg), index, 0);
	if (! neighbor_prev.empty())
	  prev = trg;
      }
      
      for (index_type trg = target + 1; trg < length - 1 && next < 0; ++ trg) {
	neighbor_next = neighbors(alignment.source_indexes(trg), index, 0);
	if (! neighbor_next.empty())
	  next = trg;
      }
      
      // only gaps between tagged tokens are filled
      if (prev < 0 || next < 0 || next - prev - 1 > __max_gap_size)
	return neighbor_type();
      
      neighbor_prev.intersect(neighbor_next);
      
      return neighbor_prev;
    }
  };
};
