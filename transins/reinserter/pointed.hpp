// -*- mode: c++ -*-
//
//  Copyright(C) 2020 transins developers
//

#ifndef __TRANSINS__REINSERTER__POINTED__HPP__
#define __TRANSINS__REINSERTER__POINTED__HPP__ 1

// relocation of tags assigned to source tokens which no target token
// points to, since those tags would never be reinserted.

#include <transins/tokens.hpp>
#include <transins/tag_map.hpp>
#include <transins/tag_index.hpp>
#include <transins/alignment.hpp>

namespace transins
{
  namespace reinserter
  {
    // A tag pair without any pointed source token in its span is
    // removed. opening and isolated tags move to the next pointed token,
    // closing tags to the previous one. tags with nowhere to go are
    // appended to unused.
    void move_to_pointed(TagIndex& index,
			 const TagMap& tag_map,
			 const Alignment::index_set_type& pointed,
			 tokens_type& unused);
    
    // same, for isolated tags only
    void move_isolated_to_pointed(TagIndex& index,
				  const Alignment::index_set_type& pointed,
				  tokens_type& unused);
  };
};

#endif
