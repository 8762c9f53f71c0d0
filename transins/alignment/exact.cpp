//
//  Copyright(C) 2020 transins developers
//

#include <iterator>
#include <algorithm>
#include <set>

#define BOOST_SPIRIT_THREADSAFE
#define PHOENIX_THREADSAFE

#include <boost/spirit/include/qi.hpp>
#include <boost/spirit/include/karma.hpp>

#include <boost/fusion/include/adapt_struct.hpp>

#include "exact.hpp"

#include "transins/error.hpp"

BOOST_FUSION_ADAPT_STRUCT(
			  transins::alignment::Exact::point_type,
			  (transins::Alignment::index_type, source)
			  (transins::Alignment::index_type, target)
			  )

namespace transins
{
  namespace alignment
  {
    void Exact::assign(const std::string& payload)
    {
      namespace qi = boost::spirit::qi;
      namespace standard = boost::spirit::standard;
      
      point_set_type points;
      
      std::string::const_iterator iter = payload.begin();
      std::string::const_iterator end  = payload.end();
      
      const bool result = qi::phrase_parse(iter, end, *(qi::lexeme[qi::int_ >> '-' >> qi::int_]), standard::space, points);
      if (! result || iter != end)
	throw MalformedAlignment("invalid links: " + payload);
      
      point_set_type::const_iterator piter_end = points.end();
      for (point_set_type::const_iterator piter = points.begin(); piter != piter_end; ++ piter)
	if (piter->source < 0 || piter->target < 0)
	  throw MalformedAlignment("negative index: " + payload);
      
      assign(points);
    }
    
    void Exact::assign(const point_set_type& points)
    {
      __links.clear();
      
      point_set_type::const_iterator piter_end = points.end();
      for (point_set_type::const_iterator piter = points.begin(); piter != piter_end; ++ piter)
	__links[piter->target].push_back(piter->source);
      
      link_map_type::iterator liter_end = __links.end();
      for (link_map_type::iterator liter = __links.begin(); liter != liter_end; ++ liter)
	std::sort(liter->second.begin(), liter->second.end());
    }
    
    Exact::point_set_type Exact::points() const
    {
      point_set_type points;
      
      link_map_type::const_iterator liter_end = __links.end();
      for (link_map_type::const_iterator liter = __links.begin(); liter != liter_end; ++ liter) {
	index_set_type::const_iterator siter_end = liter->second.end();
	for (index_set_type::const_iterator siter = liter->second.begin(); siter != siter_end; ++ siter)
	  points.push_back(point_type(*siter, liter->first));
      }
      
      std::stable_sort(points.begin(), points.end());
      
      return points;
    }
    
    Exact::index_set_type Exact::source_indexes(const index_type target) const
    {
      link_map_type::const_iterator liter = __links.find(target);
      
      return (liter != __links.end() ? liter->second : index_set_type());
    }
    
    Exact::index_set_type Exact::pointed() const
    {
      std::set<index_type, std::less<index_type>, std::allocator<index_type> > pointed;
      
      link_map_type::const_iterator liter_end = __links.end();
      for (link_map_type::const_iterator liter = __links.begin(); liter != liter_end; ++ liter)
	pointed.insert(liter->second.begin(), liter->second.end());
      
      return index_set_type(pointed.begin(), pointed.end());
    }
    
    Exact::size_type Exact::shift_source(const index_type offset)
    {
      size_type dropped = 0;
      
      link_map_type::iterator liter = __links.begin();
      while (liter != __links.end()) {
	index_set_type shifted;
	
	index_set_type::const_iterator siter_end = liter->second.end();
	for (index_set_type::const_iterator siter = liter->second.begin(); siter != siter_end; ++ siter) {
	  if (*siter + offset >= 0)
	    shifted.push_back(*siter + offset);
	  else
	    ++ dropped;
	}
	
	if (shifted.empty())
	  __links.erase(liter ++);
	else {
	  liter->second.swap(shifted);
	  ++ liter;
	}
      }
      
      return dropped;
    }
    
    Exact::size_type Exact::shift_target(const index_type offset)
    {
      size_type dropped = 0;
      link_map_type shifted;
      
      link_map_type::const_iterator liter_end = __links.end();
      for (link_map_type::const_iterator liter = __links.begin(); liter != liter_end; ++ liter) {
	if (liter->first + offset >= 0)
	  shifted[liter->first + offset] = liter->second;
	else
	  dropped += liter->second.size();
      }
      
      __links.swap(shifted);
      
      return dropped;
    }
    
    void Exact::write(std::ostream& os) const
    {
      typedef std::ostream_iterator<char> iterator_type;
      
      namespace karma = boost::spirit::karma;
      
      const point_set_type points = this->points();
      
      iterator_type iter(os);
      if (! karma::generate(iter, -((karma::int_ << '-' << karma::int_) % ' '), points))
	throw std::runtime_error("alignment generation failed...?");
    }
  };
};
