// -*- mode: c++ -*-
//
//  Copyright(C) 2020 transins developers
//

#ifndef __TRANSINS__SENTENCE_SPLITTER__HPP__
#define __TRANSINS__SENTENCE_SPLITTER__HPP__ 1

#include <transins/tokens.hpp>
#include <transins/tag_map.hpp>

namespace transins
{
  // a tagged sentence with the tags at its boundaries taken apart.
  // boundary tags are reinserted positionally, not via alignment.
  
  struct SplitSentence
  {
    tokens_type tokens;
    tokens_type tokens_without_tags;
    tokens_type beginning;
    tokens_type end;
    
    SplitSentence() {}
    // no boundary split
    explicit SplitSentence(const tokens_type& __tokens) { assign(__tokens); }
    
    void assign(const tokens_type& __tokens)
    {
      clear();
      tokens = __tokens;
      remove_tags(tokens, tokens_without_tags);
    }
    
    void clear()
    {
      tokens.clear();
      tokens_without_tags.clear();
      beginning.clear();
      end.clear();
    }
  };
  
  struct SentenceSplitter
  {
    typedef SplitSentence sentence_type;
    
    // isolated tags and tag pairs wrapping the whole sentence go to the
    // boundary sets. tags wrapping only a part stay in the interior.
    void operator()(const tokens_type& tokens, const TagMap& tag_map, sentence_type& split) const;
  };
};

#endif
