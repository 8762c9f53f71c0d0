// -*- mode: c++ -*-
//
//  Copyright(C) 2020 transins developers
//

#ifndef __TRANSINS__MARKUP_REINSERTER__HPP__
#define __TRANSINS__MARKUP_REINSERTER__HPP__ 1

// reinsert the tags of a tagged source sentence into its untagged
// translation, guided by the alignment of both.
//
// a strategy builds the assignment of source tags to source tokens and
// places them around the aligned target tokens. the result is cleaned
// up the same way for all strategies:
//
//   sub-word defragmentation
//   sub-word merge
//   inversion repair
//   redundant tag removal (baseline and improved only)
//   balancing
//   neighbor merge
//   flush of unused tags
//   restoration of empty tag pairs
//
// throws MarkupInconsistency when the source tags are not balanced.

#include <string>

#include <transins/tokens.hpp>
#include <transins/alignment.hpp>

namespace transins
{
  class MarkupReinserter
  {
  public:
    typedef enum {
      BASELINE = 0,
      IMPROVED,
      COMPLETE_MAPPING,
    } strategy_type;
    
    typedef int gap_type;
    
  public:
    MarkupReinserter(const strategy_type __strategy=COMPLETE_MAPPING,
		     const gap_type __max_gap_size=0)
      : strategy(__strategy), max_gap_size(__max_gap_size) {}
    
  public:
    // tags which could not be placed are appended to output, and
    // reported in unused
    void operator()(const tokens_type& source,
		    const tokens_type& target,
		    const Alignment& alignment,
		    tokens_type& output,
		    tokens_type& unused) const;
    
    void operator()(const tokens_type& source,
		    const tokens_type& target,
		    const Alignment& alignment,
		    tokens_type& output) const
    {
      tokens_type unused;
      operator()(source, target, alignment, output, unused);
    }
    
  public:
    static strategy_type parse_strategy(const std::string& name);
    static const char* name(const strategy_type strategy);
    static const char* lists();
    
    // target tokens with their aligned source tokens, for debugging
    static std::string sentence_alignment(const tokens_type& source,
					  const tokens_type& target,
					  const Alignment& alignment);
    
  public:
    strategy_type strategy;
    gap_type      max_gap_size;
  };
};

#endif
