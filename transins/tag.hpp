// -*- mode: c++ -*-
//
//  Copyright(C) 2020 transins developers
//

#ifndef __TRANSINS__TAG__HPP__
#define __TRANSINS__TAG__HPP__ 1

#include <string>

#include <unicode/utypes.h>

namespace transins
{
  // A tag token is two code points: a kind marker followed by the id
  // encoded as an offset from id_base, both in the private use area.
  
  class Tag
  {
  public:
    typedef enum {
      NONE = 0,
      OPENING,
      CLOSING,
      ISOLATED,
    } kind_type;
    
    typedef int         id_type;
    typedef std::string token_type;
    
    static const UChar32 opening_marker  = 0xE101;
    static const UChar32 closing_marker  = 0xE102;
    static const UChar32 isolated_marker = 0xE103;
    static const UChar32 id_base         = 0xE110;
    
  public:
    Tag() : __kind(NONE), __id(-1) {}
    Tag(const kind_type& kind, const id_type& id) : __kind(kind), __id(id) {}
    explicit Tag(const token_type& token) : __kind(NONE), __id(-1) { assign(token); }
    
  public:
    void assign(const token_type& token);
    
    token_type token() const;
    
    const kind_type& kind() const { return __kind; }
    const id_type& id() const { return __id; }
    
    bool empty() const { return __kind == NONE; }
    
  public:
    static bool is_tag(const token_type& token) { return ! Tag(token).empty(); }
    static bool is_opening(const token_type& token) { return Tag(token).kind() == OPENING; }
    static bool is_closing(const token_type& token) { return Tag(token).kind() == CLOSING; }
    static bool is_isolated(const token_type& token) { return Tag(token).kind() == ISOLATED; }
    
    // opening and isolated tags bind to the next content token,
    // closing tags to the previous one
    static bool is_forward(const token_type& token)
    {
      const kind_type kind = Tag(token).kind();
      return kind == OPENING || kind == ISOLATED;
    }
    static bool is_backward(const token_type& token) { return is_closing(token); }
    
    static token_type opening(const id_type& id) { return Tag(OPENING, id).token(); }
    static token_type closing(const id_type& id) { return Tag(CLOSING, id).token(); }
    static token_type isolated(const id_type& id) { return Tag(ISOLATED, id).token(); }

    // <u0>, </u0> or <u0/> for tags, the token itself otherwise
    static token_type readable(const token_type& token);
    
  private:
    kind_type __kind;
    id_type   __id;
  };

  inline
  bool operator==(const Tag& x, const Tag& y)
  {
    return x.kind() == y.kind() && x.id() == y.id();
  }
  
  inline
  bool operator!=(const Tag& x, const Tag& y)
  {
    return ! (x == y);
  }
};

#endif
