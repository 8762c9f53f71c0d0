// -*- mode: c++ -*-
//
//  Copyright(C) 2020 transins developers
//

#ifndef __TRANSINS__ERROR__HPP__
#define __TRANSINS__ERROR__HPP__ 1

#include <stdexcept>
#include <string>

namespace transins
{
  // alignment payload which is neither "s-t" pairs nor a score matrix
  class MalformedAlignment : public std::runtime_error
  {
  public:
    explicit MalformedAlignment(const std::string& message)
      : std::runtime_error("malformed alignment: " + message) {}
  };
  
  // source tags which cannot be paired up
  class MarkupInconsistency : public std::runtime_error
  {
  public:
    explicit MarkupInconsistency(const std::string& message)
      : std::runtime_error("markup inconsistency: " + message) {}
  };
};

#endif
