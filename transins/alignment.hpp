// -*- mode: c++ -*-
//
//  Copyright(C) 2020 transins developers
//

#ifndef __TRANSINS__ALIGNMENT__HPP__
#define __TRANSINS__ALIGNMENT__HPP__ 1

// relation from target token indexes to source token indexes, as
// produced by a translation engine.
//
// source and target offsets compensate for synthetic tokens, such as a
// leading target language token. an exact alignment rewrites its links
// when shifted, a probabilistic one keeps its scores and applies the
// offsets on every read. links whose shifted index becomes negative are
// unreachable.

#include <stdint.h>

#include <iostream>
#include <vector>
#include <string>

#include <boost/shared_ptr.hpp>

namespace transins
{
  class Alignment
  {
  public:
    typedef int32_t index_type;
    typedef size_t  size_type;
    
    typedef std::vector<index_type, std::allocator<index_type> > index_set_type;
    
    typedef boost::shared_ptr<Alignment> alignment_ptr_type;
    
  public:
    Alignment() {}
    virtual ~Alignment() {}
    
  private:
    Alignment(const Alignment& x) {}
    Alignment& operator=(const Alignment& x) { return *this; }
    
  public:
    // sorted source indexes of a target index, empty when unaligned
    virtual index_set_type source_indexes(const index_type target) const=0;
    
    // sorted source indexes which are pointed to by any target index
    virtual index_set_type pointed() const=0;
    
    // rebase indexes. returns the number of links which became unreachable
    virtual size_type shift_source(const index_type offset)=0;
    virtual size_type shift_target(const index_type offset)=0;
    
    virtual void write(std::ostream& os) const=0;
    
    virtual const char* name() const=0;
    
  public:
    // "s-t ..." pairs yield an exact alignment, anything else a score
    // matrix. throws MalformedAlignment
    static alignment_ptr_type create(const std::string& payload);
    static const char* lists();
    
    friend
    std::ostream& operator<<(std::ostream& os, const Alignment& x)
    {
      x.write(os);
      return os;
    }
  };
};

#endif
