//
//  Copyright(C) 2020 transins developers
//

#include "baseline.hpp"

#include "transins/tag.hpp"

namespace transins
{
  namespace reinserter
  {
    void Baseline::index(const SplitSentence& sentence,
			 const TagMap& tag_map,
			 const Alignment& alignment,
			 TagIndex& index,
			 tokens_type& unused) const
    {
      index.assign(sentence.tokens_without_tags.size());
      unused.clear();
      
      int offset = 0;
      for (int i = 0; i != static_cast<int>(sentence.tokens.size()); ++ i)
	if (Tag::is_tag(sentence.tokens[i])) {
	  index[i - offset].push_back(sentence.tokens[i]);
	  ++ offset;
	}
    }
    
    void Baseline::reinsert(const SplitSentence& sentence,
			    TagIndex& index,
			    const tokens_type& target,
			    const Alignment& alignment,
			    tokens_type& output) const
    {
      typedef Alignment::index_set_type index_set_type;
      typedef Alignment::index_type     index_type;
      
      output.clear();
      
      for (index_type trg = 0; trg != index_type(target.size()); ++ trg) {
	const index_set_type sources = alignment.source_indexes(trg);
	
	index_set_type::const_iterator siter_end = sources.end();
	for (index_set_type::const_iterator siter = sources.begin(); siter != siter_end; ++ siter)
	  if (index.valid(*siter) && ! index.consumed(*siter)) {
	    const tokens_type& tags = index.consume(*siter);
	    output.insert(output.end(), tags.begin(), tags.end());
	  }
	
	output.push_back(target[trg]);
      }
      
      // tags behind the last source token, then anything not reached
      if (! index.consumed(index.eos())) {
	const tokens_type& tags = index.consume(index.eos());
	output.insert(output.end(), tags.begin(), tags.end());
      }
      
      for (index_type pos = 0; pos != index_type(index.size()); ++ pos)
	if (! index.consumed(pos)) {
	  const tokens_type& tags = index.consume(pos);
	  output.insert(output.end(), tags.begin(), tags.end());
	}
    }
  };
};
