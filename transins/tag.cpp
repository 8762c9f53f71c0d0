//
//  Copyright(C) 2020 transins developers
//

#include <stdexcept>

#include "tag.hpp"

#include <unicode/unistr.h>
#include <unicode/bytestream.h>
#include <unicode/utf8.h>

#include <boost/lexical_cast.hpp>

namespace transins
{
  void Tag::assign(const token_type& token)
  {
    __kind = NONE;
    __id   = -1;
    
    // both code points are three byte sequences
    if (token.size() != 6) return;
    
    const uint8_t* data = reinterpret_cast<const uint8_t*>(token.c_str());
    const int32_t length = token.size();
    int32_t pos = 0;
    
    UChar32 marker;
    UChar32 code;
    U8_NEXT(data, pos, length, marker);
    if (marker < 0 || pos == length) return;
    U8_NEXT(data, pos, length, code);
    if (code < id_base || pos != length) return;
    
    switch (marker) {
    case opening_marker:  __kind = OPENING;  break;
    case closing_marker:  __kind = CLOSING;  break;
    case isolated_marker: __kind = ISOLATED; break;
    default: return;
    }
    
    __id = code - id_base;
  }
  
  Tag::token_type Tag::token() const
  {
    if (__id < 0 || __id > 0xF8FF - id_base)
      throw std::runtime_error("invalid tag id: " + boost::lexical_cast<std::string>(__id));
    
    icu::UnicodeString utoken;
    switch (__kind) {
    case OPENING:  utoken.append(opening_marker);  break;
    case CLOSING:  utoken.append(closing_marker);  break;
    case ISOLATED: utoken.append(isolated_marker); break;
    default:
      throw std::runtime_error("no tag kind");
    }
    utoken.append(UChar32(id_base + __id));
    
    token_type token;
    icu::StringByteSink<token_type> __sink(&token);
    utoken.toUTF8(__sink);
    
    return token;
  }
  
  Tag::token_type Tag::readable(const token_type& token)
  {
    const Tag tag(token);
    const std::string id = boost::lexical_cast<std::string>(tag.id());
    
    switch (tag.kind()) {
    case OPENING:  return "<u" + id + ">";
    case CLOSING:  return "</u" + id + ">";
    case ISOLATED: return "<u" + id + "/>";
    default:       return token;
    }
  }
};
