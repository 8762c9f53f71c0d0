// -*- mode: c++ -*-
//
//  Copyright(C) 2009-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __UTILS__RESOURCE__HPP__
#define __UTILS__RESOURCE__HPP__ 1

#include <iostream>

#include <sys/time.h>
#include <sys/resource.h>

// a snapshot of the process cpu time (user plus system) and the
// wall-clock time. the difference of two snapshots is the cost of the
// work in between.

namespace utils
{
  class resource
  {
  public:
    resource() { sample(); }

  public:
    void sample()
    {
      struct rusage  usage;
      struct timeval wall;

      ::getrusage(RUSAGE_SELF, &usage);
      ::gettimeofday(&wall, 0);

      __cpu_time  = seconds(usage.ru_utime) + seconds(usage.ru_stime);
      __wall_time = seconds(wall);
    }

    double cpu_time() const { return __cpu_time; }
    double wall_time() const { return __wall_time; }

    resource& operator-=(const resource& x)
    {
      __cpu_time  -= x.__cpu_time;
      __wall_time -= x.__wall_time;
      return *this;
    }

    friend
    resource operator-(resource x, const resource& y)
    {
      x -= y;
      return x;
    }

    friend
    std::ostream& operator<<(std::ostream& os, const resource& x)
    {
      os << "cpu time: " << x.__cpu_time << " wall time: " << x.__wall_time;
      return os;
    }

  private:
    static double seconds(const struct timeval& x) { return double(x.tv_sec) + 1e-6 * x.tv_usec; }

  private:
    double __cpu_time;
    double __wall_time;
  };
};

#endif
