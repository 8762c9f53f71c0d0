// -*- mode: c++ -*-
//
//  Copyright(C) 2020 transins developers
//

#ifndef __TRANSINS__TOKENS__HPP__
#define __TRANSINS__TOKENS__HPP__ 1

#include <string>
#include <vector>

namespace transins
{
  typedef std::string token_type;
  typedef std::vector<token_type, std::allocator<token_type> > tokens_type;
  
  // appended to a target sentence so that tags aligned past its last
  // token are placed. never emitted.
  extern const token_type eos_token;
  
  // sub-word fragments carry this suffix
  extern const token_type fragment_suffix;
  
  // split at ASCII blanks
  void split(const std::string& line, tokens_type& tokens);
  
  std::string join(const tokens_type& tokens);
  
  // same as join, with tags rendered human readable
  std::string readable(const tokens_type& tokens);
  
  bool is_fragment(const token_type& token);
  
  void remove_tags(const tokens_type& tokens, tokens_type& removed);
  
  inline
  tokens_type remove_tags(const tokens_type& tokens)
  {
    tokens_type removed;
    remove_tags(tokens, removed);
    return removed;
  }
};

#endif
