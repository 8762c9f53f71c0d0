//
//  Copyright(C) 2020 transins developers
//

#include <iterator>
#include <sstream>
#include <set>

#define BOOST_SPIRIT_THREADSAFE
#define PHOENIX_THREADSAFE

#include <boost/spirit/include/qi.hpp>
#include <boost/spirit/include/karma.hpp>

#include "probabilistic.hpp"

#include "transins/error.hpp"

namespace transins
{
  namespace alignment
  {
    void Probabilistic::assign(const std::string& payload)
    {
      namespace qi = boost::spirit::qi;
      namespace standard = boost::spirit::standard;
      
      typedef std::string::const_iterator iterator_type;
      
      clear();
      
      // rows are lexemes, separated by blanks
      qi::rule<iterator_type, score_set_type()> row = qi::double_ % ',';
      
      iterator_type iter = payload.begin();
      iterator_type end  = payload.end();
      
      const bool result = qi::phrase_parse(iter, end, *row, standard::space, __matrix);
      if (! result || iter != end) {
	__matrix.clear();
	throw MalformedAlignment("invalid scores: " + payload);
      }
      
      matrix_type::const_iterator miter_end = __matrix.end();
      for (matrix_type::const_iterator miter = __matrix.begin(); miter != miter_end; ++ miter)
	if (miter->size() != __matrix.front().size()) {
	  __matrix.clear();
	  throw MalformedAlignment("rows differ in length: " + payload);
	}
    }
    
    Probabilistic::index_type Probabilistic::best(const index_type target, const score_type threshold) const
    {
      const index_type row = target - __target_offset;
      if (target < 0 || row < 0 || row >= static_cast<index_type>(__matrix.size())) return -1;
      
      const score_set_type& scores = __matrix[row];
      
      score_type max = 0.0;
      index_type best = -1;
      for (index_type i = 0; i != static_cast<index_type>(scores.size()); ++ i)
	if (scores[i] >= threshold && scores[i] > max && i + __source_offset >= 0) {
	  max = scores[i];
	  best = i + __source_offset;
	}
      
      return best;
    }
    
    Probabilistic::index_set_type Probabilistic::source_indexes(const index_type target) const
    {
      const index_type source = best(target);
      
      return (source >= 0 ? index_set_type(1, source) : index_set_type());
    }
    
    Probabilistic::index_set_type Probabilistic::source_indexes(const index_type target, const score_type threshold) const
    {
      index_set_type sources;
      
      const index_type row = target - __target_offset;
      if (target < 0 || row < 0 || row >= static_cast<index_type>(__matrix.size())) return sources;
      
      const score_set_type& scores = __matrix[row];
      for (index_type i = 0; i != static_cast<index_type>(scores.size()); ++ i)
	if (scores[i] >= threshold && i + __source_offset >= 0)
	  sources.push_back(i + __source_offset);
      
      return sources;
    }
    
    Probabilistic::index_set_type Probabilistic::pointed() const
    {
      std::set<index_type, std::less<index_type>, std::allocator<index_type> > pointed;
      
      for (index_type row = 0; row != static_cast<index_type>(__matrix.size()); ++ row) {
	const index_type target = row + __target_offset;
	
	// rows shifted below zero are hidden
	if (target < 0) continue;
	
	const index_type source = best(target);
	if (source >= 0)
	  pointed.insert(source);
      }
      
      return index_set_type(pointed.begin(), pointed.end());
    }
    
    Probabilistic::size_type Probabilistic::shift_source(const index_type offset)
    {
      const size_type columns = (__matrix.empty() ? size_type(0) : __matrix.front().size());
      const size_type hidden_prev = hidden(__source_offset, columns);
      
      __source_offset += offset;
      
      const size_type hidden_next = hidden(__source_offset, columns);
      
      return (hidden_next > hidden_prev ? (hidden_next - hidden_prev) * __matrix.size() : size_type(0));
    }
    
    Probabilistic::size_type Probabilistic::shift_target(const index_type offset)
    {
      const size_type columns = (__matrix.empty() ? size_type(0) : __matrix.front().size());
      const size_type hidden_prev = hidden(__target_offset, __matrix.size());
      
      __target_offset += offset;
      
      const size_type hidden_next = hidden(__target_offset, __matrix.size());
      
      return (hidden_next > hidden_prev ? (hidden_next - hidden_prev) * columns : size_type(0));
    }
    
    void Probabilistic::hard(const score_type threshold, Exact& exact) const
    {
      Exact::point_set_type points;
      
      for (index_type row = 0; row != static_cast<index_type>(__matrix.size()); ++ row) {
	const index_type target = row + __target_offset;
	if (target < 0) continue;
	
	const index_set_type sources = source_indexes(target, threshold);
	
	index_set_type::const_iterator siter_end = sources.end();
	for (index_set_type::const_iterator siter = sources.begin(); siter != siter_end; ++ siter)
	  points.push_back(Exact::point_type(*siter, target));
      }
      
      exact.assign(points);
    }
    
    std::string Probabilistic::best_links() const
    {
      std::ostringstream os;
      
      for (index_type row = 0; row != static_cast<index_type>(__matrix.size()); ++ row) {
	const index_type target = row + __target_offset;
	const index_type source = best(target);
	
	if (target < 0 || source < 0) continue;
	
	if (! os.str().empty())
	  os << ' ';
	os << target << '-' << source;
      }
      
      return os.str();
    }
    
    void Probabilistic::write(std::ostream& os) const
    {
      typedef std::ostream_iterator<char> iterator_type;
      
      namespace karma = boost::spirit::karma;
      
      iterator_type iter(os);
      if (! karma::generate(iter, -((karma::double_ % ',') % ' '), __matrix))
	throw std::runtime_error("alignment generation failed...?");
    }
  };
};
