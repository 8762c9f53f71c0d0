// -*- mode: c++ -*-
//
//  Copyright(C) 2010 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __UTILS__BOUNDED_QUEUE__HPP__
#define __UTILS__BOUNDED_QUEUE__HPP__ 1

// fixed capacity queue shared by producer and consumer threads.
// push blocks when full, pop blocks when empty.

#include <vector>
#include <algorithm>

#include <boost/noncopyable.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/condition.hpp>

namespace utils
{
  template <typename Tp, typename Alloc=std::allocator<Tp> >
  class bounded_queue : private boost::noncopyable
  {
  private:
    typedef std::vector<Tp, Alloc>    buffer_type;
    typedef boost::mutex              mutex_type;
    typedef boost::condition          condition_type;
    typedef boost::mutex::scoped_lock lock_type;
    
  public:
    typedef typename buffer_type::size_type size_type;
    
  public:
    explicit bounded_queue(const size_type n)
      : buffer(std::max(n, size_type(1))), first(0), last(0), buffered(0) {}
    
  public:
    size_type size() const { lock_type lock(mutex); return buffered; }
    bool empty() const { lock_type lock(mutex); return buffered == 0; }
    
    void push(const Tp& x)
    {
      Tp value(x);
      push_swap(value);
    }
    
    void push_swap(Tp& x)
    {
      lock_type lock(mutex);
      
      while (buffered == buffer.size())
	not_full.wait(lock);
      
      using std::swap;
      
      swap(buffer[last], x);
      last = (last + 1) % buffer.size();
      ++ buffered;
      
      not_empty.notify_one();
    }
    
    void pop_swap(Tp& x)
    {
      lock_type lock(mutex);
      
      while (buffered == 0)
	not_empty.wait(lock);
      
      using std::swap;
      
      swap(x, buffer[first]);
      buffer[first] = Tp();
      first = (first + 1) % buffer.size();
      -- buffered;
      
      not_full.notify_one();
    }
    
  private:
    buffer_type buffer;
    size_type   first;
    size_type   last;
    size_type   buffered;
    
    mutable mutex_type mutex;
    condition_type     not_full;
    condition_type     not_empty;
  };
};

#endif
