//
//  Copyright(C) 2020 transins developers
//

#include <iostream>
#include <algorithm>

#include "document.hpp"

#include "error.hpp"
#include "cleanup.hpp"
#include "tag.hpp"

namespace transins
{
  std::string Document::operator()(const id_type id,
				    const std::string& source,
				    const std::string& translation,
				    const std::string& alignment)
  {
    statistics_type stats;
    
    tokens_type source_tokens;
    tokens_type target_tokens;
    
    split(source, source_tokens);
    split(translation, target_tokens);
    
    ++ stats.sentences;
    
    tokens_type output;
    
    try {
      std::string payload = alignment;
      if (payload.empty() && ! alignments.empty())
	alignments.find(source, translation, payload);
      
      Alignment::alignment_ptr_type aligned = Alignment::create(payload);
      
      if (source_offset)
	stats.unreachable += aligned->shift_source(source_offset);
      if (target_offset)
	stats.unreachable += aligned->shift_target(target_offset);
      
      if (debug >= 2)
	std::cerr << "sentence alignment:" << '\n'
		  << MarkupReinserter::sentence_alignment(source_tokens, target_tokens, *aligned);
      
      tokens_type unused;
      reinserter(source_tokens, target_tokens, *aligned, output, unused);
      
      stats.unused += unused.size();
      
      if (debug && ! unused.empty())
	std::cerr << "unused tags: " << readable(unused) << std::endl;
      
      if (std::find_if(source_tokens.begin(), source_tokens.end(), Tag::is_tag) != source_tokens.end())
	++ stats.tagged;
    }
    catch (const MalformedAlignment& err) {
      ++ stats.malformed;
      
      if (debug)
	std::cerr << err.what() << " source: " << readable(source_tokens) << std::endl;
      
      cleanup::merge_fragments(remove_tags(target_tokens), output);
    }
    catch (const MarkupInconsistency& err) {
      ++ stats.inconsistent;
      
      if (debug)
	std::cerr << err.what() << " source: " << readable(source_tokens) << std::endl;
      
      cleanup::merge_fragments(remove_tags(target_tokens), output);
    }
    
    if (debug && stats.unreachable)
      std::cerr << "unreachable alignment points: " << stats.unreachable << std::endl;
    
    const std::string tagged = join(output);
    
    lock_type lock(__mutex);
    
    __stats += stats;
    
    if (id != id_type(-1)) {
      if (id >= __results.size())
	__results.resize(id + 1);
      __results[id] = tagged;
    }
    
    return tagged;
  }
  
  std::string Document::result(const id_type id) const
  {
    lock_type lock(__mutex);
    
    return (id < __results.size() ? __results[id] : std::string());
  }
  
  Document::size_type Document::size() const
  {
    lock_type lock(__mutex);
    
    return __results.size();
  }
  
  Document::statistics_type Document::statistics() const
  {
    lock_type lock(__mutex);
    
    return __stats;
  }
  
  void Document::clear()
  {
    lock_type lock(__mutex);
    
    __results.clear();
    __stats.clear();
  }
};
