// -*- mode: c++ -*-
//
//  Copyright(C) 2020 transins developers
//

#ifndef __TRANSINS__REINSERTER__COMPLETE_MAPPING__HPP__
#define __TRANSINS__REINSERTER__COMPLETE_MAPPING__HPP__ 1

#include <set>

#include <transins/tokens.hpp>
#include <transins/tag_map.hpp>
#include <transins/tag_index.hpp>
#include <transins/alignment.hpp>
#include <transins/sentence_splitter.hpp>

namespace transins
{
  namespace reinserter
  {
    // Each content token carries every tag pair open at its position,
    // together with the closing tags, so that a target token is wrapped
    // by all the pairs wrapping its source tokens. target tokens without
    // tags borrow the tags common to their neighbours within max_gap_size
    // tokens.
    
    class CompleteMapping
    {
    public:
      typedef TagIndex::index_type index_type;
      typedef int                  gap_type;
      
      typedef std::set<token_type, std::less<token_type>, std::allocator<token_type> > used_set_type;
      
      static const bool substitute_empty_pairs = true;
      static const bool split_boundaries       = true;
      static const bool remove_redundant       = false;
      
      // tags in front of and behind a target token
      struct neighbor_type
      {
	tokens_type before;
	tokens_type after;
	
	bool empty() const { return before.empty() && after.empty(); }
	
	// keep the tags found in x as well
	void intersect(const neighbor_type& x);
      };
      
    public:
      explicit CompleteMapping(const gap_type max_gap_size=0) : __max_gap_size(max_gap_size) {}
      
    public:
      void index(const SplitSentence& sentence,
		 const TagMap& tag_map,
		 const Alignment& alignment,
		 TagIndex& index,
		 tokens_type& unused) const;
      
      void reinsert(const SplitSentence& sentence,
		    TagIndex& index,
		    const tokens_type& target,
		    const Alignment& alignment,
		    tokens_type& output) const;
      
      // tags of the source tokens. isolated tags are taken once when used
      // is given, and ignored otherwise.
      static neighbor_type neighbors(const Alignment::index_set_type& sources,
				     const TagIndex& index,
				     used_set_type* used);
      
      // length counts the end of sentence marker
      neighbor_type interpolate_unaligned(const index_type target,
					  const index_type length,
					  const Alignment& alignment,
					  const TagIndex& index) const;
      neighbor_type interpolate_untagged(const index_type target,
					 const index_type length,
					 const Alignment& alignment,
					 const TagIndex& index) const;
      
      const gap_type& max_gap_size() const { return __max_gap_size; }
      
    private:
      gap_type __max_gap_size;
    };
  };
};

#endif
