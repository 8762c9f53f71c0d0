//
//  Copyright(C) 2020 transins developers
//

#include "tokens.hpp"
#include "tag.hpp"

#include <boost/tokenizer.hpp>

namespace transins
{
  const token_type eos_token = "end-of-target-sentence-marker";
  const token_type fragment_suffix = "@@";
  
  void split(const std::string& line, tokens_type& tokens)
  {
    typedef boost::char_separator<char>        separator_type;
    typedef boost::tokenizer<separator_type>   tokenizer_type;
    
    // ASCII blanks only, so that multibyte sequences stay intact
    tokenizer_type tokenizer(line, separator_type(" \t\n\r\f\v"));
    
    tokens.clear();
    tokens.insert(tokens.end(), tokenizer.begin(), tokenizer.end());
  }
  
  std::string join(const tokens_type& tokens)
  {
    std::string joined;
    
    tokens_type::const_iterator titer_end = tokens.end();
    for (tokens_type::const_iterator titer = tokens.begin(); titer != titer_end; ++ titer) {
      if (titer != tokens.begin())
	joined += ' ';
      joined += *titer;
    }
    return joined;
  }
  
  std::string readable(const tokens_type& tokens)
  {
    std::string joined;
    
    tokens_type::const_iterator titer_end = tokens.end();
    for (tokens_type::const_iterator titer = tokens.begin(); titer != titer_end; ++ titer) {
      if (titer != tokens.begin())
	joined += ' ';
      joined += Tag::readable(*titer);
    }
    return joined;
  }
  
  bool is_fragment(const token_type& token)
  {
    return (token.size() >= fragment_suffix.size()
	    && token.compare(token.size() - fragment_suffix.size(), fragment_suffix.size(), fragment_suffix) == 0
	    && ! Tag::is_tag(token));
  }
  
  void remove_tags(const tokens_type& tokens, tokens_type& removed)
  {
    removed.clear();
    
    tokens_type::const_iterator titer_end = tokens.end();
    for (tokens_type::const_iterator titer = tokens.begin(); titer != titer_end; ++ titer)
      if (! Tag::is_tag(*titer))
	removed.push_back(*titer);
  }
};
