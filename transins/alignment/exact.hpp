// -*- mode: c++ -*-
//
//  Copyright(C) 2020 transins developers
//

#ifndef __TRANSINS__ALIGNMENT__EXACT__HPP__
#define __TRANSINS__ALIGNMENT__EXACT__HPP__ 1

#include <map>

#include <transins/alignment.hpp>

namespace transins
{
  namespace alignment
  {
    // discrete links, kept sorted by target then source
    class Exact : public transins::Alignment
    {
    public:
      struct point_type
      {
	index_type source;
	index_type target;
	
	point_type() : source(), target() {}
	point_type(const index_type& _source, const index_type& _target) : source(_source), target(_target) {}
	
	friend
	bool operator<(const point_type& x, const point_type& y)
	{
	  return x.source < y.source || (!(y.source < x.source) && x.target < y.target);
	}
      };
      typedef std::vector<point_type, std::allocator<point_type> > point_set_type;
      
    private:
      typedef std::map<index_type, index_set_type, std::less<index_type>,
		       std::allocator<std::pair<const index_type, index_set_type> > > link_map_type;
      
    public:
      Exact() {}
      explicit Exact(const std::string& payload) { assign(payload); }
      explicit Exact(const point_set_type& points) { assign(points); }
      
    public:
      // throws MalformedAlignment
      void assign(const std::string& payload);
      void assign(const point_set_type& points);
      
      void clear() { __links.clear(); }
      bool empty() const { return __links.empty(); }
      
      // links ordered by source, then target
      point_set_type points() const;
      
      index_set_type source_indexes(const index_type target) const;
      index_set_type pointed() const;
      
      size_type shift_source(const index_type offset);
      size_type shift_target(const index_type offset);
      
      void write(std::ostream& os) const;
      
      const char* name() const { return "exact"; }
      
    private:
      link_map_type __links;
    };
  };
  
  typedef alignment::Exact ExactAlignment;
};

#endif
