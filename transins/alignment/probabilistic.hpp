// -*- mode: c++ -*-
//
//  Copyright(C) 2020 transins developers
//

#ifndef __TRANSINS__ALIGNMENT__PROBABILISTIC__HPP__
#define __TRANSINS__ALIGNMENT__PROBABILISTIC__HPP__ 1

#include <algorithm>

#include <transins/alignment.hpp>
#include <transins/alignment/exact.hpp>

namespace transins
{
  namespace alignment
  {
    // dense [target][source] score matrix. links are derived by
    // thresholding, with offsets applied lazily.
    class Probabilistic : public transins::Alignment
    {
    public:
      typedef double score_type;
      typedef std::vector<score_type, std::allocator<score_type> > score_set_type;
      typedef std::vector<score_set_type, std::allocator<score_set_type> > matrix_type;
      
    public:
      Probabilistic() : __source_offset(0), __target_offset(0) {}
      explicit Probabilistic(const std::string& payload) : __source_offset(0), __target_offset(0) { assign(payload); }
      
    public:
      // throws MalformedAlignment
      void assign(const std::string& payload);
      
      void clear()
      {
	__matrix.clear();
	__source_offset = 0;
	__target_offset = 0;
      }
      bool empty() const { return __matrix.empty(); }
      
      const matrix_type& matrix() const { return __matrix; }
      
      // the first source index with the maximum score at or above the
      // threshold, or -1. zero scores are never selected
      index_type best(const index_type target, const score_type threshold=0.0) const;
      
      index_set_type source_indexes(const index_type target) const;
      // all source indexes scored at or above the threshold
      index_set_type source_indexes(const index_type target, const score_type threshold) const;
      index_set_type pointed() const;
      
      size_type shift_source(const index_type offset);
      size_type shift_target(const index_type offset);
      
      // every link scored at or above the threshold
      void hard(const score_type threshold, Exact& exact) const;
      
      // best links as "t-s" pairs
      std::string best_links() const;
      
      void write(std::ostream& os) const;
      
      const char* name() const { return "probabilistic"; }
      
    private:
      size_type hidden(const index_type offset, const size_type size) const
      {
	return offset >= 0 ? 0 : std::min(size, size_type(- offset));
      }
      
    private:
      matrix_type __matrix;
      index_type  __source_offset;
      index_type  __target_offset;
    };
  };
  
  typedef alignment::Probabilistic ProbabilisticAlignment;
};

#endif
