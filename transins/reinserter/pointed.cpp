//
//  Copyright(C) 2020 transins developers
//

#include <algorithm>

#include "pointed.hpp"

#include "transins/tag.hpp"

namespace transins
{
  namespace reinserter
  {
    typedef TagIndex::index_type index_type;
    
    namespace impl
    {
      inline
      bool is_pointed(const Alignment::index_set_type& pointed, const index_type pos)
      {
	return std::binary_search(pointed.begin(), pointed.end(), pos);
      }
      
      inline
      bool erase(tokens_type& tokens, const token_type& token)
      {
	tokens_type::iterator iter = std::find(tokens.begin(), tokens.end(), token);
	if (iter == tokens.end()) return false;
	
	tokens.erase(iter);
	return true;
      }
      
      // tag pairs whose span contains no pointed token
      void remove_unpointed_pairs(TagIndex& index,
				  const TagMap& tag_map,
				  const Alignment::index_set_type& pointed,
				  tokens_type& unused)
      {
	for (index_type pos = 0; pos != index_type(index.size()); ++ pos) {
	  if (is_pointed(pointed, pos)) continue;
	  
	  const tokens_type tags = index[pos];
	  
	  tokens_type::const_iterator titer_end = tags.end();
	  for (tokens_type::const_iterator titer = tags.begin(); titer != titer_end; ++ titer) {
	    if (! Tag::is_closing(*titer)) continue;
	    
	    const token_type& opening = tag_map.opening(*titer);
	    
	    index_type pos_opening = pos;
	    for (/**/; pos_opening >= 0; -- pos_opening)
	      if (std::find(index[pos_opening].begin(), index[pos_opening].end(), opening) != index[pos_opening].end())
		break;
	    
	    if (pos_opening < 0) continue;
	    
	    bool found = false;
	    for (index_type i = pos_opening; i <= pos && ! found; ++ i)
	      found = is_pointed(pointed, i);
	    
	    if (! found) {
	      erase(index[pos], *titer);
	      erase(index[pos_opening], opening);
	      
	      unused.insert(unused.begin(), opening);
	      unused.push_back(*titer);
	    }
	  }
	}
      }
      
      // forward tags, as a group, move in front of the tags of the next
      // pointed token. visiting from the back keeps the source order.
      template <typename Pred>
      void move_forward(TagIndex& index,
			const Alignment::index_set_type& pointed,
			tokens_type& unused,
			Pred pred)
      {
	// the end of sentence slot never receives tags
	const index_type eos = index.eos();
	
	for (index_type pos = eos; pos >= 0; -- pos) {
	  if (is_pointed(pointed, pos)) continue;
	  
	  tokens_type moved;
	  tokens_type kept;
	  
	  tokens_type::const_iterator titer_end = index[pos].end();
	  for (tokens_type::const_iterator titer = index[pos].begin(); titer != titer_end; ++ titer)
	    (pred(*titer) ? moved : kept).push_back(*titer);
	  
	  if (moved.empty()) continue;
	  
	  index[pos].swap(kept);
	  
	  index_type next = pos + 1;
	  while (next < eos && ! is_pointed(pointed, next))
	    ++ next;
	  
	  if (next < eos)
	    index[next].insert(index[next].begin(), moved.begin(), moved.end());
	  else
	    unused.insert(unused.end(), moved.begin(), moved.end());
	}
      }
      
      // closing tags move behind the tags of the previous pointed token
      void move_backward(TagIndex& index, const Alignment::index_set_type& pointed)
      {
	for (index_type pos = 0; pos != index_type(index.size()); ++ pos) {
	  if (is_pointed(pointed, pos)) continue;
	  
	  index_type prev = pos - 1;
	  while (prev >= 0 && ! is_pointed(pointed, prev))
	    -- prev;
	  
	  if (prev < 0) continue;
	  
	  tokens_type kept;
	  
	  tokens_type::const_iterator titer_end = index[pos].end();
	  for (tokens_type::const_iterator titer = index[pos].begin(); titer != titer_end; ++ titer)
	    (Tag::is_closing(*titer) ? index[prev] : kept).push_back(*titer);
	  
	  index[pos].swap(kept);
	}
      }
      
      struct is_forward
      {
	bool operator()(const token_type& token) const { return Tag::is_forward(token); }
      };
      
      struct is_isolated
      {
	bool operator()(const token_type& token) const { return Tag::is_isolated(token); }
      };
    };
    
    void move_to_pointed(TagIndex& index,
			 const TagMap& tag_map,
			 const Alignment::index_set_type& pointed,
			 tokens_type& unused)
    {
      unused.clear();
      
      impl::remove_unpointed_pairs(index, tag_map, pointed, unused);
      impl::move_forward(index, pointed, unused, impl::is_forward());
      impl::move_backward(index, pointed);
    }
    
    void move_isolated_to_pointed(TagIndex& index,
				  const Alignment::index_set_type& pointed,
				  tokens_type& unused)
    {
      unused.clear();
      
      impl::move_forward(index, pointed, unused, impl::is_isolated());
    }
  };
};
