// -*- mode: c++ -*-
//
//  Copyright(C) 2020 transins developers
//

#ifndef __TRANSINS__REINSERTER__BASELINE__HPP__
#define __TRANSINS__REINSERTER__BASELINE__HPP__ 1

#include <transins/tokens.hpp>
#include <transins/tag_map.hpp>
#include <transins/tag_index.hpp>
#include <transins/alignment.hpp>
#include <transins/sentence_splitter.hpp>

namespace transins
{
  namespace reinserter
  {
    // Every tag binds to the content token following it, closing tags
    // included, and is emitted in front of the first target token
    // aligned to that source token, as mtrain does. closing tags may
    // end up in front of the wrong token under reordering.
    
    struct Baseline
    {
      static const bool substitute_empty_pairs = false;
      static const bool split_boundaries       = false;
      static const bool remove_redundant       = true;
      
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
    };
  };
};

#endif
