// -*- mode: c++ -*-
//
//  Copyright(C) 2020 transins developers
//

#ifndef __TRANSINS__MASKER__HPP__
#define __TRANSINS__MASKER__HPP__ 1

#include <string>

#include <boost/shared_ptr.hpp>

#include <transins/tokens.hpp>

namespace transins
{
  // Tags are ornamented with the first character of the following and
  // the last character of the preceding content token, so that a
  // whitespace based detokenizer treats them as part of their
  // neighbours. unmask() removes the ornaments, detokenize() the blanks
  // inside of tags.
  //
  // A masker holds compiled patterns and is not thread safe. Use one
  // instance per thread.
  
  class Masker
  {
  private:
    struct impl_type;
    
  public:
    Masker();
    
  public:
    std::string mask(const tokens_type& tokens) const;
    std::string unmask(const std::string& line) const;
    std::string detokenize(const std::string& line) const;
    
  private:
    boost::shared_ptr<impl_type> pimpl;
  };
};

#endif
