//
//  Copyright(C) 2020 transins developers
//

#include "tag_map.hpp"

#include <stdexcept>

#include "tag.hpp"
#include "tokens.hpp"
#include "error.hpp"
#include "test_tags.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE tag_test

#include <boost/test/unit_test.hpp>

BOOST_AUTO_TEST_CASE(tag_token)
{
  using transins::Tag;

  const std::string opening = Tag::opening(0);

  BOOST_CHECK_EQUAL(opening, "\xEE\x84\x81\xEE\x84\x90");
  BOOST_CHECK_EQUAL(Tag::closing(1), "\xEE\x84\x82\xEE\x84\x91");
  BOOST_CHECK_EQUAL(Tag::isolated(2), "\xEE\x84\x83\xEE\x84\x92");

  const Tag tag(Tag::closing(42));
  BOOST_CHECK_EQUAL(tag.kind(), Tag::CLOSING);
  BOOST_CHECK_EQUAL(tag.id(), 42);
  BOOST_CHECK(tag == Tag(Tag::CLOSING, 42));
  BOOST_CHECK(tag != Tag(Tag::OPENING, 42));

  BOOST_CHECK_THROW(Tag(Tag::OPENING, -1).token(), std::runtime_error);
  BOOST_CHECK_THROW(Tag().token(), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(tag_predicates)
{
  using transins::Tag;

  BOOST_CHECK(Tag::is_tag(Tag::opening(3)));
  BOOST_CHECK(! Tag::is_tag("x"));
  BOOST_CHECK(! Tag::is_tag(""));
  BOOST_CHECK(! Tag::is_tag("abcdef"));
  BOOST_CHECK(! Tag::is_tag("\xEE\x84\x81"));
  BOOST_CHECK(! Tag::is_tag(Tag::opening(3) + "x"));

  BOOST_CHECK(Tag::is_opening(Tag::opening(3)));
  BOOST_CHECK(Tag::is_closing(Tag::closing(3)));
  BOOST_CHECK(Tag::is_isolated(Tag::isolated(3)));

  BOOST_CHECK(Tag::is_forward(Tag::opening(3)));
  BOOST_CHECK(Tag::is_forward(Tag::isolated(3)));
  BOOST_CHECK(! Tag::is_forward(Tag::closing(3)));
  BOOST_CHECK(Tag::is_backward(Tag::closing(3)));
  BOOST_CHECK(! Tag::is_backward(Tag::isolated(3)));
  BOOST_CHECK(! Tag::is_forward("x"));
  BOOST_CHECK(! Tag::is_backward("x"));
}

BOOST_AUTO_TEST_CASE(tag_readable)
{
  using transins::Tag;

  BOOST_CHECK_EQUAL(Tag::readable(Tag::opening(0)), "<u0>");
  BOOST_CHECK_EQUAL(Tag::readable(Tag::closing(1)), "</u1>");
  BOOST_CHECK_EQUAL(Tag::readable(Tag::isolated(6)), "<u6/>");
  BOOST_CHECK_EQUAL(Tag::readable("x"), "x");

  BOOST_CHECK_EQUAL(transins::readable(transins::test::tokens("OPEN1 x CLOSE1 ISO2")), "<u0> x </u1> <u7/>");
}

BOOST_AUTO_TEST_CASE(tokens_split)
{
  transins::tokens_type tokens;

  transins::split("  a\tb  c\n", tokens);
  BOOST_CHECK_EQUAL(tokens.size(), 3);
  BOOST_CHECK_EQUAL(transins::join(tokens), "a b c");

  transins::split("", tokens);
  BOOST_CHECK(tokens.empty());

  BOOST_CHECK(transins::is_fragment("Th@@"));
  BOOST_CHECK(! transins::is_fragment("This"));
  BOOST_CHECK(! transins::is_fragment("@"));

  BOOST_CHECK_EQUAL(transins::test::names(transins::remove_tags(transins::test::tokens("ISO1 a OPEN1 b CLOSE1 c"))), "a b c");
}

BOOST_AUTO_TEST_CASE(tag_map_pairs)
{
  using transins::test::tag;

  const transins::TagMap fixture = transins::test::tag_map();

  BOOST_CHECK_EQUAL(fixture.size(), 3);
  BOOST_CHECK_EQUAL(fixture.closing(tag("OPEN1")), tag("CLOSE1"));
  BOOST_CHECK_EQUAL(fixture.closing(tag("OPEN2")), tag("CLOSE2"));
  BOOST_CHECK_EQUAL(fixture.closing(tag("OPEN3")), tag("CLOSE3"));
  BOOST_CHECK_EQUAL(fixture.opening(tag("CLOSE1")), tag("OPEN1"));
  BOOST_CHECK_EQUAL(fixture.opening(tag("CLOSE2")), tag("OPEN2"));
  BOOST_CHECK_EQUAL(fixture.opening(tag("CLOSE3")), tag("OPEN3"));
  BOOST_CHECK(fixture.closing(tag("ISO1")).empty());
  BOOST_CHECK(fixture.opening("x").empty());

  const transins::TagMap nested(transins::test::tokens("ISO1 OPEN1 x OPEN2 y CLOSE2 z CLOSE1 ISO2"));
  BOOST_CHECK_EQUAL(nested.size(), 2);
  BOOST_CHECK_EQUAL(nested.closing(tag("OPEN1")), tag("CLOSE1"));
  BOOST_CHECK_EQUAL(nested.opening(tag("CLOSE2")), tag("OPEN2"));

  const transins::TagMap sequence(transins::test::tokens("OPEN1 x CLOSE1 OPEN2 y CLOSE2"));
  BOOST_CHECK_EQUAL(sequence.size(), 2);
  BOOST_CHECK_EQUAL(sequence.begin()->first, tag("OPEN1"));
}

BOOST_AUTO_TEST_CASE(tag_map_inconsistent)
{
  BOOST_CHECK_THROW(transins::TagMap(transins::test::tokens("x CLOSE1 y")), transins::MarkupInconsistency);
  BOOST_CHECK_THROW(transins::TagMap(transins::test::tokens("x OPEN1 y")), transins::MarkupInconsistency);
  BOOST_CHECK_NO_THROW(transins::TagMap(transins::test::tokens("x y z")));
}
