// -*- mode: c++ -*-
//
//  Copyright(C) 2020 transins developers
//

#ifndef __TRANSINS__CLEANUP__HPP__
#define __TRANSINS__CLEANUP__HPP__ 1

// passes applied to a target sentence after tags are reinserted.
// every pass leaves clean, balanced input untouched.

#include <transins/tokens.hpp>
#include <transins/tag_map.hpp>

namespace transins
{
  namespace cleanup
  {
    // tags between the fragments of a word are moved around the word:
    // opening and isolated tags in front, closing tags behind
    void defragment(const tokens_type& tokens, const TagMap& tag_map, tokens_type& defragmented);
    
    // concatenate fragments, dropping the fragment suffix
    void merge_fragments(const tokens_type& tokens, tokens_type& merged);
    
    // a closing tag in front of its opening tag is swapped with it, and
    // both are slid past adjacent tags next to content. a closing tag
    // without a following opening tag is removed.
    void repair_inversions(const TagMap& tag_map, tokens_type& tokens);
    
    // keep the outermost opening and closing tag of repeated tag pairs
    void remove_redundant(const TagMap& tag_map, tokens_type& tokens);
    
    // sort runs of opening and closing tags, then close and reopen
    // crossing tags so that tag pairs nest
    void balance(const TagMap& tag_map, tokens_type& tokens);
    
    // remove a closing tag immediately reopened
    void merge_neighbors(const TagMap& tag_map, tokens_type& tokens);
    
    // source tags missing in the target, in source order
    void collect_unused(const tokens_type& source, const tokens_type& target, tokens_type& unused);
  };
};

#endif
