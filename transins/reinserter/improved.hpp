// -*- mode: c++ -*-
//
//  Copyright(C) 2020 transins developers
//

#ifndef __TRANSINS__REINSERTER__IMPROVED__HPP__
#define __TRANSINS__REINSERTER__IMPROVED__HPP__ 1

#include <transins/tokens.hpp>
#include <transins/tag_map.hpp>
#include <transins/tag_index.hpp>
#include <transins/alignment.hpp>
#include <transins/sentence_splitter.hpp>

namespace transins
{
  namespace reinserter
  {
    // Opening and isolated tags bind to the following content token,
    // closing tags to the preceding one. tags of unpointed source tokens
    // are moved to pointed ones, and tags are inserted in front of or
    // behind the target tokens by direction.
    
    struct Improved
    {
      typedef TagIndex::index_type index_type;
      
      static const bool substitute_empty_pairs = true;
      static const bool split_boundaries       = true;
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
      
      // tags of a source token. a fragment yields the tags of all the
      // fragments of its word.
      static void source_tags(const index_type pos,
			      const TagIndex& index,
			      const tokens_type& words,
			      tokens_type& tags);
    };
  };
};

#endif
