//
//  Copyright(C) 2020 transins developers
//

#include <stdexcept>

#include "masker.hpp"
#include "tag.hpp"

#include <boost/scoped_ptr.hpp>

#include <unicode/unistr.h>
#include <unicode/bytestream.h>
#include <unicode/regex.h>
#include <unicode/utf8.h>

namespace transins
{
  struct Masker::impl_type
  {
    struct Replace
    {
    public:
      Replace(const char* pattern, const char* subst) { initialize(pattern, subst); }
      
      const icu::UnicodeString& operator()(icu::UnicodeString& uline) const
      {
	UErrorCode status = U_ZERO_ERROR;
	matcher->reset(uline);
	uline = matcher->replaceAll(substitute, status);
	if (U_FAILURE(status))
	  throw std::runtime_error(std::string("RegexMatcher::replaceAll(): ") + u_errorName(status));
	return uline;
      }
      
    private:
      void initialize(const char* pattern, const char* subst)
      {
	UErrorCode status = U_ZERO_ERROR;
	matcher.reset(new icu::RegexMatcher(icu::UnicodeString::fromUTF8(pattern), 0, status));
	if (U_FAILURE(status))
	  throw std::runtime_error(std::string("RegexMatcher: ") + u_errorName(status));
	
	substitute = icu::UnicodeString::fromUTF8(subst);
      }
      
    private:
      boost::scoped_ptr<icu::RegexMatcher> matcher;
      icu::UnicodeString substitute;
    };
    
    impl_type()
      : unmask_tag("\\S?([\\uE101\\uE102\\uE103].)\\S?", "$1"),
	strip_opening("(\\uE101.) +", "$1"),
	strip_closing(" +(\\uE102.)", "$1"),
	strip_isolated("(\\uE103.) +", "$1") {}
    
    static std::string first_char(const std::string& token)
    {
      const uint8_t* data = reinterpret_cast<const uint8_t*>(token.c_str());
      int32_t pos = 0;
      U8_FWD_1(data, pos, int32_t(token.size()));
      return token.substr(0, pos);
    }
    
    static std::string last_char(const std::string& token)
    {
      const uint8_t* data = reinterpret_cast<const uint8_t*>(token.c_str());
      int32_t pos = token.size();
      U8_BACK_1(data, 0, pos);
      return token.substr(pos);
    }
    
    static std::string utf8(const icu::UnicodeString& uline)
    {
      std::string line;
      icu::StringByteSink<std::string> __sink(&line);
      uline.toUTF8(__sink);
      return line;
    }
    
    Replace unmask_tag;
    Replace strip_opening;
    Replace strip_closing;
    Replace strip_isolated;
  };
  
  Masker::Masker() : pimpl(new impl_type()) {}
  
  std::string Masker::mask(const tokens_type& tokens) const
  {
    std::string masked;
    
    for (size_t i = 0; i != tokens.size(); ++ i) {
      if (i)
	masked += ' ';
      
      if (! Tag::is_tag(tokens[i])) {
	masked += tokens[i];
	continue;
      }
      
      for (size_t next = i + 1; next < tokens.size(); ++ next)
	if (! Tag::is_tag(tokens[next]) && ! tokens[next].empty()) {
	  masked += impl_type::first_char(tokens[next]);
	  break;
	}
      
      masked += tokens[i];
      
      for (size_t prev = i; prev > 0; -- prev)
	if (! Tag::is_tag(tokens[prev - 1]) && ! tokens[prev - 1].empty()) {
	  masked += impl_type::last_char(tokens[prev - 1]);
	  break;
	}
    }
    
    return masked;
  }
  
  std::string Masker::unmask(const std::string& line) const
  {
    icu::UnicodeString uline = icu::UnicodeString::fromUTF8(line);
    
    pimpl->unmask_tag(uline);
    
    return impl_type::utf8(uline);
  }
  
  std::string Masker::detokenize(const std::string& line) const
  {
    icu::UnicodeString uline = icu::UnicodeString::fromUTF8(line);
    
    pimpl->strip_opening(uline);
    pimpl->strip_closing(uline);
    pimpl->strip_isolated(uline);
    
    return impl_type::utf8(uline);
  }
};
