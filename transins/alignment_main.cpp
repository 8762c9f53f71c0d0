//
//  Copyright(C) 2020 transins developers
//

#include <sstream>

#include "alignment.hpp"
#include "alignment/exact.hpp"
#include "alignment/probabilistic.hpp"
#include "error.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE alignment_test

#include <boost/test/unit_test.hpp>

typedef transins::Alignment::index_set_type index_set_type;

template <typename Tp>
std::string to_string(const Tp& x)
{
  std::ostringstream os;
  os << x;
  return os.str();
}

std::string hard(const transins::ProbabilisticAlignment& alignment, const double threshold)
{
  transins::ExactAlignment exact;
  alignment.hard(threshold, exact);
  return to_string(exact);
}

BOOST_AUTO_TEST_CASE(alignment_create)
{
  transins::Alignment::alignment_ptr_type alignment;

  alignment = transins::Alignment::create("0-0 1-2 2-1");
  BOOST_CHECK_EQUAL(std::string(alignment->name()), "exact");

  alignment = transins::Alignment::create("0.9,0.1 0.2,0.8");
  BOOST_CHECK_EQUAL(std::string(alignment->name()), "probabilistic");

  alignment = transins::Alignment::create("");
  BOOST_CHECK_EQUAL(std::string(alignment->name()), "exact");
  BOOST_CHECK(alignment->source_indexes(0).empty());
  BOOST_CHECK(alignment->pointed().empty());

  BOOST_CHECK_THROW(transins::Alignment::create("abcd"), transins::MalformedAlignment);
  BOOST_CHECK_THROW(transins::Alignment::create("0-1 x-2"), transins::MalformedAlignment);
  BOOST_CHECK_THROW(transins::Alignment::create("0.1,0.2 0.3"), transins::MalformedAlignment);
}

BOOST_AUTO_TEST_CASE(exact_links)
{
  BOOST_CHECK_THROW(transins::ExactAlignment("ab-cd"), transins::MalformedAlignment);
  BOOST_CHECK_THROW(transins::ExactAlignment("1-"), transins::MalformedAlignment);

  const transins::ExactAlignment alignment("1-1 2-1 3-1");
  BOOST_CHECK_EQUAL(alignment.source_indexes(1).size(), 3);
  BOOST_CHECK_EQUAL(alignment.source_indexes(1)[0], 1);
  BOOST_CHECK_EQUAL(alignment.source_indexes(1)[2], 3);
  BOOST_CHECK(alignment.source_indexes(0).empty());
  BOOST_CHECK_EQUAL(to_string(alignment), "1-1 2-1 3-1");

  const transins::ExactAlignment inverse("3-1 2-1 1-1");
  BOOST_CHECK(inverse.source_indexes(1) == alignment.source_indexes(1));

  const transins::ExactAlignment unaligned("1-2 2-2 3-3");
  BOOST_CHECK(unaligned.source_indexes(1).empty());
  BOOST_CHECK(unaligned.source_indexes(4).empty());
}

BOOST_AUTO_TEST_CASE(exact_pointed)
{
  index_set_type pointed;

  pointed = transins::ExactAlignment("1-1 2-1 3-1").pointed();
  BOOST_CHECK_EQUAL(pointed.size(), 3);

  pointed = transins::ExactAlignment("1-1 1-2 1-3").pointed();
  BOOST_CHECK_EQUAL(pointed.size(), 1);
  BOOST_CHECK_EQUAL(pointed.front(), 1);

  pointed = transins::ExactAlignment("1-1 1-2 3-3").pointed();
  BOOST_CHECK_EQUAL(pointed.size(), 2);
  BOOST_CHECK_EQUAL(pointed[0], 1);
  BOOST_CHECK_EQUAL(pointed[1], 3);
}

BOOST_AUTO_TEST_CASE(exact_shift)
{
  transins::ExactAlignment source("1-1 2-2 3-3");

  BOOST_CHECK_EQUAL(source.shift_source(0), 0);
  BOOST_CHECK_EQUAL(to_string(source), "1-1 2-2 3-3");
  BOOST_CHECK_EQUAL(source.shift_source(-1), 0);
  BOOST_CHECK_EQUAL(to_string(source), "0-1 1-2 2-3");
  BOOST_CHECK_EQUAL(source.shift_source(2), 0);
  BOOST_CHECK_EQUAL(to_string(source), "2-1 3-2 4-3");
  BOOST_CHECK_EQUAL(source.shift_source(-3), 1);
  BOOST_CHECK_EQUAL(to_string(source), "0-2 1-3");

  transins::ExactAlignment target("1-1 2-2 3-3");

  BOOST_CHECK_EQUAL(target.shift_target(-1), 0);
  BOOST_CHECK_EQUAL(to_string(target), "1-0 2-1 3-2");
  BOOST_CHECK_EQUAL(target.shift_target(2), 0);
  BOOST_CHECK_EQUAL(to_string(target), "1-2 2-3 3-4");
  BOOST_CHECK_EQUAL(target.shift_target(-3), 1);
  BOOST_CHECK_EQUAL(to_string(target), "2-0 3-1");
  BOOST_CHECK_EQUAL(target.source_indexes(0).front(), 2);
}

BOOST_AUTO_TEST_CASE(probabilistic_scores)
{
  BOOST_CHECK_THROW(transins::ProbabilisticAlignment("abcd"), transins::MalformedAlignment);

  BOOST_CHECK(transins::ProbabilisticAlignment("").empty());

  transins::ProbabilisticAlignment alignment("0.1,0.2,0.3");
  BOOST_CHECK_EQUAL(alignment.matrix().size(), 1);
  BOOST_CHECK_EQUAL(alignment.matrix().front().size(), 3);

  alignment.assign("0.1,0.2,0.3 0.6,0.4,0.5");
  BOOST_CHECK_EQUAL(alignment.matrix().size(), 2);
  BOOST_CHECK_EQUAL(alignment.matrix().back().size(), 3);

  BOOST_CHECK_EQUAL(alignment.best(0), 2);
  BOOST_CHECK_EQUAL(alignment.best(1), 0);
  BOOST_CHECK_EQUAL(alignment.best(0, 0.5), -1);
  BOOST_CHECK_EQUAL(alignment.best(2), -1);

  BOOST_CHECK_EQUAL(alignment.source_indexes(0).size(), 1);
  BOOST_CHECK_EQUAL(alignment.source_indexes(0).front(), 2);

  BOOST_CHECK_EQUAL(alignment.source_indexes(0, 0.0).size(), 3);
  BOOST_CHECK_EQUAL(alignment.source_indexes(1, 0.0).size(), 3);
  BOOST_CHECK(alignment.source_indexes(0, 0.5).empty());
  BOOST_CHECK_EQUAL(alignment.source_indexes(0, 0.3).size(), 1);
  BOOST_CHECK_EQUAL(alignment.source_indexes(0, 0.2).size(), 2);
  BOOST_CHECK_EQUAL(alignment.source_indexes(0, 0.2).front(), 1);

  BOOST_CHECK_EQUAL(alignment.best_links(), "0-2 1-0");
}

BOOST_AUTO_TEST_CASE(probabilistic_pointed)
{
  index_set_type pointed;

  pointed = transins::ProbabilisticAlignment("1.0,0.0,0.0 1.0,0.0,0.0 1.0,0.0,0.0").pointed();
  BOOST_CHECK_EQUAL(pointed.size(), 1);
  BOOST_CHECK_EQUAL(pointed.front(), 0);

  pointed = transins::ProbabilisticAlignment("0.3,0.2,0.1 0.4,0.6,0.5 0.7,0.8,0.9").pointed();
  BOOST_CHECK_EQUAL(pointed.size(), 3);

  pointed = transins::ProbabilisticAlignment("0.3,0.2,0.1 0.6,0.4,0.5 0.7,0.8,0.9").pointed();
  BOOST_CHECK_EQUAL(pointed.size(), 2);
  BOOST_CHECK_EQUAL(pointed[0], 0);
  BOOST_CHECK_EQUAL(pointed[1], 2);

  // zero scores are never links
  pointed = transins::ProbabilisticAlignment("0.0,0.0 0.0,0.0").pointed();
  BOOST_CHECK(pointed.empty());
}

BOOST_AUTO_TEST_CASE(probabilistic_hard)
{
  const transins::ProbabilisticAlignment alignment("0.1,0.2,0.3 0.6,0.4,0.5");

  BOOST_CHECK_EQUAL(hard(alignment, 0.1), "0-0 0-1 1-0 1-1 2-0 2-1");
  BOOST_CHECK_EQUAL(hard(alignment, 0.2), "0-1 1-0 1-1 2-0 2-1");
  BOOST_CHECK_EQUAL(hard(alignment, 0.3), "0-1 1-1 2-0 2-1");
  BOOST_CHECK_EQUAL(hard(alignment, 0.4), "0-1 1-1 2-1");
}

BOOST_AUTO_TEST_CASE(probabilistic_shift)
{
  transins::ProbabilisticAlignment source("0.1,0.2,0.3 0.6,0.4,0.5");

  BOOST_CHECK_EQUAL(source.shift_source(0), 0);
  BOOST_CHECK_EQUAL(hard(source, 0.4), "0-1 1-1 2-1");
  BOOST_CHECK_EQUAL(source.shift_source(1), 0);
  BOOST_CHECK_EQUAL(hard(source, 0.4), "1-1 2-1 3-1");
  BOOST_CHECK_EQUAL(source.shift_source(-1), 0);
  BOOST_CHECK_EQUAL(hard(source, 0.4), "0-1 1-1 2-1");
  BOOST_CHECK_EQUAL(source.shift_source(-1), 2);
  BOOST_CHECK_EQUAL(hard(source, 0.4), "0-1 1-1");

  transins::ProbabilisticAlignment target("0.1,0.2,0.3 0.6,0.4,0.5");

  BOOST_CHECK_EQUAL(target.shift_target(0), 0);
  BOOST_CHECK_EQUAL(hard(target, 0.4), "0-1 1-1 2-1");
  BOOST_CHECK_EQUAL(target.shift_target(1), 0);
  BOOST_CHECK_EQUAL(hard(target, 0.4), "0-2 1-2 2-2");
  BOOST_CHECK_EQUAL(target.shift_target(-1), 0);
  BOOST_CHECK_EQUAL(hard(target, 0.4), "0-1 1-1 2-1");
  BOOST_CHECK_EQUAL(target.shift_target(-2), 6);
  BOOST_CHECK_EQUAL(hard(target, 0.4), "");
  BOOST_CHECK(target.pointed().empty());
}

BOOST_AUTO_TEST_CASE(probabilistic_shift_pointed)
{
  // the first row belongs to a leading language token
  transins::ProbabilisticAlignment alignment("0.9,0.1,0.0 0.0,0.1,0.9");

  BOOST_CHECK_EQUAL(alignment.shift_target(-1), 3);

  const index_set_type pointed = alignment.pointed();
  BOOST_REQUIRE_EQUAL(pointed.size(), 1);
  BOOST_CHECK_EQUAL(pointed[0], 2);

  BOOST_CHECK_EQUAL(alignment.best(-1), -1);
  BOOST_CHECK_EQUAL(alignment.best(0), 2);
}
