//
//  Copyright(C) 2020 transins developers
//

#include <algorithm>
#include <sstream>
#include <iomanip>
#include <stdexcept>

#include <boost/algorithm/string/case_conv.hpp>

#include "markup_reinserter.hpp"

#include "tag.hpp"
#include "tag_map.hpp"
#include "tag_index.hpp"
#include "empty_tag_pairs.hpp"
#include "sentence_splitter.hpp"
#include "cleanup.hpp"

#include "reinserter/baseline.hpp"
#include "reinserter/improved.hpp"
#include "reinserter/complete_mapping.hpp"

namespace transins
{
  namespace impl
  {
    // tags missing in the output, the ones given up by the strategy first
    inline
    void flush_unused(const tokens_type& source, tokens_type& output, tokens_type& unused)
    {
      tokens_type missing;
      cleanup::collect_unused(source, output, missing);
      
      tokens_type flushed;
      
      tokens_type::const_iterator uiter_end = unused.end();
      for (tokens_type::const_iterator uiter = unused.begin(); uiter != uiter_end; ++ uiter) {
	tokens_type::iterator miter = std::find(missing.begin(), missing.end(), *uiter);
	
	if (miter != missing.end()) {
	  flushed.push_back(*miter);
	  missing.erase(miter);
	}
      }
      flushed.insert(flushed.end(), missing.begin(), missing.end());
      
      output.insert(output.end(), flushed.begin(), flushed.end());
      unused.swap(flushed);
    }
    
    template <typename Strategy>
    void reinsert(const Strategy& strategy,
		  const tokens_type& source,
		  const tokens_type& target,
		  const Alignment& alignment,
		  tokens_type& output,
		  tokens_type& unused)
    {
      const TagMap tag_map(source);
      
      EmptyTagPairs empty_tag_pairs;
      tokens_type   substituted;
      
      if (Strategy::substitute_empty_pairs)
	empty_tag_pairs.substitute(source, tag_map, substituted);
      else
	substituted = source;
      
      SplitSentence sentence;
      if (Strategy::split_boundaries)
	SentenceSplitter()(substituted, tag_map, sentence);
      else
	sentence.assign(substituted);
      
      TagIndex index;
      unused.clear();
      
      strategy.index(sentence, tag_map, alignment, index, unused);
      
      tokens_type tagged;
      strategy.reinsert(sentence, index, target, alignment, tagged);
      
      tokens_type defragmented;
      cleanup::defragment(tagged, tag_map, defragmented);
      
      tokens_type merged;
      cleanup::merge_fragments(defragmented, merged);
      
      cleanup::repair_inversions(tag_map, merged);
      if (Strategy::remove_redundant)
	cleanup::remove_redundant(tag_map, merged);
      cleanup::balance(tag_map, merged);
      cleanup::merge_neighbors(tag_map, merged);
      
      flush_unused(substituted, merged, unused);
      
      if (empty_tag_pairs.empty())
	output.swap(merged);
      else {
	empty_tag_pairs.restore(merged, output);
	
	tokens_type restored;
	empty_tag_pairs.restore(unused, restored);
	unused.swap(restored);
      }
    }
  };
  
  void MarkupReinserter::operator()(const tokens_type& source,
				    const tokens_type& target,
				    const Alignment& alignment,
				    tokens_type& output,
				    tokens_type& unused) const
  {
    output.clear();
    
    switch (strategy) {
    case BASELINE:
      impl::reinsert(reinserter::Baseline(), source, target, alignment, output, unused);
      break;
    case IMPROVED:
      impl::reinsert(reinserter::Improved(), source, target, alignment, output, unused);
      break;
    case COMPLETE_MAPPING:
      impl::reinsert(reinserter::CompleteMapping(max_gap_size), source, target, alignment, output, unused);
      break;
    default:
      throw std::runtime_error("unknown strategy");
    }
  }
  
  MarkupReinserter::strategy_type MarkupReinserter::parse_strategy(const std::string& name)
  {
    const std::string lowered = boost::algorithm::to_lower_copy(name);
    
    if (lowered == "baseline" || lowered == "mtrain")
      return BASELINE;
    else if (lowered == "improved" || lowered == "mtrain-improved")
      return IMPROVED;
    else if (lowered == "complete" || lowered == "complete-mapping")
      return COMPLETE_MAPPING;
    else
      throw std::runtime_error("unknown strategy: " + name);
  }
  
  const char* MarkupReinserter::name(const strategy_type strategy)
  {
    switch (strategy) {
    case BASELINE:         return "baseline";
    case IMPROVED:         return "improved";
    case COMPLETE_MAPPING: return "complete";
    default:               return "unknown";
    }
  }
  
  const char* MarkupReinserter::lists()
  {
    static const char* desc = "\
baseline: tags bind to the following token, regardless of direction\n\
improved: direction aware, with boundary tags and tags moved to aligned tokens\n\
complete: every token carries all tags applying to it, gaps are interpolated\n\
";
    return desc;
  }
  
  std::string MarkupReinserter::sentence_alignment(const tokens_type& source,
						   const tokens_type& target,
						   const Alignment& alignment)
  {
    typedef Alignment::index_type     index_type;
    typedef Alignment::index_set_type index_set_type;
    
    const tokens_type words = remove_tags(source);
    
    size_t target_width = std::string("TARGET:").size();
    for (tokens_type::const_iterator titer = target.begin(); titer != target.end(); ++ titer)
      target_width = std::max(target_width, titer->size());
    
    std::ostringstream os;
    
    os << alignment << '\n';
    os << std::setw(target_width) << "TARGET:" << "    " << "SOURCE:" << '\n';
    
    for (index_type trg = 0; trg != index_type(target.size()); ++ trg) {
      os << std::setw(target_width) << target[trg] << ' ' << std::setw(2) << trg << " ->";
      
      const index_set_type sources = alignment.source_indexes(trg);
      
      index_set_type::const_iterator siter_end = sources.end();
      for (index_set_type::const_iterator siter = sources.begin(); siter != siter_end; ++ siter) {
	os << ' ' << *siter;
	if (0 <= *siter && *siter < index_type(words.size()))
	  os << ':' << words[*siter];
      }
      os << '\n';
    }
    
    return os.str();
  }
};
