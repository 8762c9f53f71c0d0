//
//  Copyright(C) 2020 transins developers
//

#include <algorithm>
#include <set>

#include "cleanup.hpp"
#include "tag.hpp"

namespace transins
{
  namespace cleanup
  {
    namespace impl
    {
      inline
      bool contains(const tokens_type& tokens, const token_type& token)
      {
	return std::find(tokens.begin(), tokens.end(), token) != tokens.end();
      }
      
      inline
      void insert_unique(tokens_type& tokens, const token_type& token)
      {
	if (! contains(tokens, token))
	  tokens.push_back(token);
      }
      
      inline
      bool erase(tokens_type& tokens, const token_type& token)
      {
	tokens_type::iterator iter = std::find(tokens.begin(), tokens.end(), token);
	if (iter == tokens.end()) return false;
	
	tokens.erase(iter);
	return true;
      }
      
      // openings in [first, last) ordered by the reverse order of their
      // closings after last. openings without closing go first.
      void sort_openings(const TagMap& tag_map, tokens_type& tokens, const int first, const int last)
      {
	tokens_type remaining(tokens.begin() + first, tokens.begin() + last);
	tokens_type sorted;
	
	for (int i = last; i < static_cast<int>(tokens.size()) && ! remaining.empty(); ++ i)
	  if (Tag::is_closing(tokens[i])) {
	    const token_type& opening = tag_map.opening(tokens[i]);
	    
	    if (erase(remaining, opening))
	      sorted.insert(sorted.begin(), opening);
	  }
	
	remaining.insert(remaining.end(), sorted.begin(), sorted.end());
	std::copy(remaining.begin(), remaining.end(), tokens.begin() + first);
      }
      
      // closings in [first, last) ordered by the reverse order of their
      // openings before first. closings without opening go last.
      void sort_closings(const TagMap& tag_map, tokens_type& tokens, const int first, const int last)
      {
	tokens_type remaining(tokens.begin() + first, tokens.begin() + last);
	tokens_type sorted;
	
	for (int i = first - 1; i >= 0 && ! remaining.empty(); -- i)
	  if (Tag::is_opening(tokens[i])) {
	    const token_type& closing = tag_map.closing(tokens[i]);
	    
	    if (erase(remaining, closing))
	      sorted.push_back(closing);
	  }
	
	sorted.insert(sorted.end(), remaining.begin(), remaining.end());
	std::copy(sorted.begin(), sorted.end(), tokens.begin() + first);
      }
    };
    
    void defragment(const tokens_type& tokens, const TagMap& tag_map, tokens_type& defragmented)
    {
      defragmented.clear();
      
      const int size = tokens.size();
      for (int i = 0; i < size; ++ i) {
	if (! is_fragment(tokens[i])) {
	  defragmented.push_back(tokens[i]);
	  continue;
	}
	
	// forward tags in front of the first fragment are already emitted
	int first = i;
	for (int j = i - 1; j >= 0 && Tag::is_forward(tokens[j]); -- j) {
	  first = j;
	  defragmented.pop_back();
	}
	
	// the last fragment is the first content token without suffix,
	// followed by any closing tags. an unfinished word extends to the end
	int last = size - 1;
	for (int j = i + 1; j < size; ++ j) {
	  if (Tag::is_tag(tokens[j]) || is_fragment(tokens[j])) continue;
	  
	  last = j;
	  for (int k = j + 1; k < size && Tag::is_closing(tokens[k]); ++ k)
	    last = k;
	  break;
	}
	
	tokens_type before;
	tokens_type after;
	tokens_type fragments;
	for (int j = first; j <= last; ++ j) {
	  if (Tag::is_forward(tokens[j]))
	    impl::insert_unique(before, tokens[j]);
	  else if (Tag::is_closing(tokens[j]))
	    impl::insert_unique(after, tokens[j]);
	  else
	    fragments.push_back(tokens[j]);
	}
	
	defragmented.insert(defragmented.end(), before.begin(), before.end());
	defragmented.insert(defragmented.end(), fragments.begin(), fragments.end());
	
	// close in reverse order of opening
	tokens_type::const_reverse_iterator biter_end = before.rend();
	for (tokens_type::const_reverse_iterator biter = before.rbegin(); biter != biter_end; ++ biter)
	  if (! Tag::is_isolated(*biter)) {
	    const token_type& closing = tag_map.closing(*biter);
	    
	    if (impl::erase(after, closing))
	      defragmented.push_back(closing);
	  }
	
	defragmented.insert(defragmented.end(), after.begin(), after.end());
	
	i = last;
      }
    }
    
    void merge_fragments(const tokens_type& tokens, tokens_type& merged)
    {
      merged.clear();
      
      std::string word;
      
      tokens_type::const_iterator titer_end = tokens.end();
      for (tokens_type::const_iterator titer = tokens.begin(); titer != titer_end; ++ titer) {
	if (is_fragment(*titer))
	  word.append(*titer, 0, titer->size() - fragment_suffix.size());
	else if (word.empty())
	  merged.push_back(*titer);
	else if (! Tag::is_tag(*titer)) {
	  word += *titer;
	  merged.push_back(word);
	  word.clear();
	} else {
	  // unfinished word followed by a tag
	  merged.push_back(word);
	  merged.push_back(*titer);
	  word.clear();
	}
      }
      
      if (! word.empty())
	merged.push_back(word);
    }
    
    void repair_inversions(const TagMap& tag_map, tokens_type& tokens)
    {
      TagMap::const_iterator piter_end = tag_map.end();
      for (TagMap::const_iterator piter = tag_map.begin(); piter != piter_end; ++ piter) {
	const token_type& opening = piter->first;
	const token_type& closing = piter->second;
	
	bool between = false;
	for (int i = 0; i < static_cast<int>(tokens.size()); ++ i) {
	  if (tokens[i] == opening) {
	    between = true;
	    continue;
	  } else if (tokens[i] != closing)
	    continue;
	  
	  if (between) {
	    between = false;
	    continue;
	  }
	  
	  bool swapped = false;
	  for (int j = i + 1; j < static_cast<int>(tokens.size()); ++ j)
	    if (tokens[j] == opening) {
	      swapped = true;
	      std::swap(tokens[i], tokens[j]);
	      
	      // opening tag in front of the closest preceding content
	      for (int prec = i - 1; prec >= 0; -- prec) {
		std::swap(tokens[prec], tokens[prec + 1]);
		if (! Tag::is_tag(tokens[prec + 1])) break;
	      }
	      
	      // closing tag behind the closest following content
	      i = j + 1;
	      for (int foll = j + 1; foll < static_cast<int>(tokens.size()); ++ foll) {
		i = foll;
		std::swap(tokens[foll - 1], tokens[foll]);
		if (! Tag::is_tag(tokens[foll - 1])) break;
	      }
	      break;
	    }
	  
	  if (! swapped) {
	    tokens.erase(tokens.begin() + i);
	    -- i;
	  }
	}
      }
    }
    
    void remove_redundant(const TagMap& tag_map, tokens_type& tokens)
    {
      TagMap::const_iterator piter_end = tag_map.end();
      for (TagMap::const_iterator piter = tag_map.begin(); piter != piter_end; ++ piter) {
	const token_type& opening = piter->first;
	const token_type& closing = piter->second;
	
	bool between = false;
	int closing_prev = -1;
	for (int i = 0; i < static_cast<int>(tokens.size()); ++ i) {
	  if (tokens[i] != opening && tokens[i] != closing) continue;
	  
	  if (between) {
	    if (tokens[i] == opening) {
	      tokens.erase(tokens.begin() + i);
	      -- i;
	    } else {
	      between = false;
	      closing_prev = i;
	    }
	  } else {
	    if (tokens[i] == opening) {
	      between = true;
	      closing_prev = -1;
	    } else if (closing_prev != -1) {
	      tokens.erase(tokens.begin() + closing_prev);
	      -- i;
	      closing_prev = i;
	    }
	  }
	}
	
	// an opening tag without closing tag
	if (between) {
	  tokens_type::reverse_iterator riter = std::find(tokens.rbegin(), tokens.rend(), opening);
	  if (riter != tokens.rend())
	    tokens.erase(-- riter.base());
	}
      }
    }
    
    void balance(const TagMap& tag_map, tokens_type& tokens)
    {
      const int size = tokens.size();
      
      int first = -1;
      for (int i = 0; i < size; ++ i) {
	if (Tag::is_opening(tokens[i])) {
	  if (first == -1)
	    first = i;
	} else {
	  if (first != -1 && i - first > 1)
	    impl::sort_openings(tag_map, tokens, first, i);
	  first = -1;
	}
      }
      
      first = -1;
      for (int i = 0; i < size; ++ i) {
	if (Tag::is_closing(tokens[i])) {
	  if (first == -1)
	    first = i;
	} else {
	  if (first != -1 && i - first > 1)
	    impl::sort_closings(tag_map, tokens, first, i);
	  first = -1;
	}
      }
      if (first != -1 && size - first > 1)
	impl::sort_closings(tag_map, tokens, first, size);
      
      // first pass: closings and reopenings around each crossing closing
      // tag are collected per position, second pass: flatten
      typedef std::vector<tokens_type, std::allocator<tokens_type> > slot_set_type;
      typedef std::vector<bool, std::allocator<bool> >               drop_set_type;
      
      slot_set_type before(size);
      slot_set_type after(size);
      drop_set_type dropped(size, false);
      
      tokens_type stack;
      
      for (int i = 0; i < size; ++ i) {
	const Tag tag(tokens[i]);
	
	if (tag.kind() == Tag::OPENING)
	  stack.push_back(tokens[i]);
	else if (tag.kind() == Tag::CLOSING) {
	  tokens_type::reverse_iterator riter = std::find(stack.rbegin(), stack.rend(), tag_map.opening(tokens[i]));
	  
	  if (riter == stack.rend()) {
	    dropped[i] = true;
	    continue;
	  }
	  
	  // open tags above the matching opening tag
	  tokens_type::iterator iter = -- riter.base();
	  
	  for (tokens_type::reverse_iterator siter = stack.rbegin(); siter != riter; ++ siter)
	    before[i].push_back(tag_map.closing(*siter));
	  after[i].insert(after[i].end(), iter + 1, stack.end());
	  
	  stack.erase(iter);
	}
      }
      
      tokens_type balanced;
      for (int i = 0; i < size; ++ i) {
	balanced.insert(balanced.end(), before[i].begin(), before[i].end());
	if (! dropped[i])
	  balanced.push_back(tokens[i]);
	balanced.insert(balanced.end(), after[i].begin(), after[i].end());
      }
      
      // opening tags never closed are closed at the end
      tokens_type::const_reverse_iterator siter_end = stack.rend();
      for (tokens_type::const_reverse_iterator siter = stack.rbegin(); siter != siter_end; ++ siter)
	balanced.push_back(tag_map.closing(*siter));
      
      tokens.swap(balanced);
    }
    
    void merge_neighbors(const TagMap& tag_map, tokens_type& tokens)
    {
      bool removed = false;
      do {
	removed = false;
	
	TagMap::const_iterator piter_end = tag_map.end();
	for (TagMap::const_iterator piter = tag_map.begin(); piter != piter_end; ++ piter) {
	  size_t i = 1;
	  while (i < tokens.size()) {
	    if (tokens[i] == piter->first && tokens[i - 1] == piter->second) {
	      tokens.erase(tokens.begin() + i - 1, tokens.begin() + i + 1);
	      removed = true;
	      i = (i >= 2 ? i - 1 : 1);
	    } else
	      ++ i;
	  }
	}
      } while (removed);
    }
    
    void collect_unused(const tokens_type& source, const tokens_type& target, tokens_type& unused)
    {
      typedef std::set<token_type, std::less<token_type>, std::allocator<token_type> > tag_set_type;
      
      tag_set_type tags;
      tokens_type::const_iterator titer_end = target.end();
      for (tokens_type::const_iterator titer = target.begin(); titer != titer_end; ++ titer)
	if (Tag::is_tag(*titer))
	  tags.insert(*titer);
      
      unused.clear();
      tokens_type::const_iterator siter_end = source.end();
      for (tokens_type::const_iterator siter = source.begin(); siter != siter_end; ++ siter)
	if (Tag::is_tag(*siter) && tags.find(*siter) == tags.end())
	  unused.push_back(*siter);
    }
  };
};
