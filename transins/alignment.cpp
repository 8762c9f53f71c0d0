//
//  Copyright(C) 2020 transins developers
//

#include <boost/regex.hpp>

#include "alignment.hpp"

#include "alignment/exact.hpp"
#include "alignment/probabilistic.hpp"

namespace transins
{
  const char* Alignment::lists()
  {
    static const char* desc = "\
exact: space separated source-target index pairs, \"0-0 1-2 2-1\"\n\
probabilistic: one row of comma separated source scores per target token, \"0.9,0.1 0.2,0.8\"\n\
";
    return desc;
  }
  
  Alignment::alignment_ptr_type Alignment::create(const std::string& payload)
  {
    static const boost::regex pattern("[0-9]-[0-9]");
    
    if (payload.find_first_not_of(" \t\r\n") == std::string::npos || boost::regex_search(payload, pattern))
      return alignment_ptr_type(new alignment::Exact(payload));
    else
      return alignment_ptr_type(new alignment::Probabilistic(payload));
  }
};
