//
//  Copyright(C) 2020 transins developers
//

#include <iterator>

#include "empty_tag_pairs.hpp"
#include "test_tags.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE empty_tag_pairs_test

#include <boost/test/unit_test.hpp>

using transins::test::tokens;
using transins::test::names;
using transins::test::tag;

struct substitution_type
{
  transins::EmptyTagPairs pairs;
  std::string substituted;

  explicit substitution_type(const std::string& x)
  {
    const transins::tokens_type original = tokens(x);

    transins::tokens_type result;
    pairs.substitute(original, transins::TagMap(original), result);
    substituted = names(result);

    transins::tokens_type restored;
    pairs.restore(result, restored);
    BOOST_CHECK_EQUAL(names(restored), names(original));
  }

  std::string replacement(const std::string& isolated) const
  {
    transins::EmptyTagPairs::const_iterator iter = pairs.begin();
    for (/**/; iter != pairs.end(); ++ iter)
      if (iter->first == tag(isolated))
	return names(iter->second);
    return std::string();
  }

  size_t size() const { return std::distance(pairs.begin(), pairs.end()); }
};

BOOST_AUTO_TEST_CASE(empty_tag_pairs_substitute)
{
  {
    const substitution_type result("x OPEN3 CLOSE3 y");
    BOOST_CHECK_EQUAL(result.substituted, "x ISO1 y");
    BOOST_CHECK_EQUAL(result.size(), 1);
    BOOST_CHECK_EQUAL(result.replacement("ISO1"), "OPEN3 CLOSE3");
  }

  {
    const substitution_type result("x OPEN3 CLOSE3 OPEN2 CLOSE2 y");
    BOOST_CHECK_EQUAL(result.substituted, "x ISO1 ISO2 y");
    BOOST_CHECK_EQUAL(result.size(), 2);
    BOOST_CHECK_EQUAL(result.replacement("ISO1"), "OPEN3 CLOSE3");
    BOOST_CHECK_EQUAL(result.replacement("ISO2"), "OPEN2 CLOSE2");
  }

  {
    const substitution_type result("x OPEN3 OPEN2 CLOSE2 CLOSE3 y");
    BOOST_CHECK_EQUAL(result.substituted, "x ISO1 y");
    BOOST_CHECK_EQUAL(result.size(), 1);
    BOOST_CHECK_EQUAL(result.replacement("ISO1"), "OPEN3 OPEN2 CLOSE2 CLOSE3");
  }

  {
    const substitution_type result("x OPEN3 ISO1 CLOSE3 y");
    BOOST_CHECK_EQUAL(result.substituted, "x ISO2 y");
    BOOST_CHECK_EQUAL(result.size(), 1);
    BOOST_CHECK_EQUAL(result.replacement("ISO2"), "OPEN3 ISO1 CLOSE3");
  }

  {
    const substitution_type result("x OPEN3 OPEN2 ISO1 CLOSE2 CLOSE3 y");
    BOOST_CHECK_EQUAL(result.substituted, "x ISO2 y");
    BOOST_CHECK_EQUAL(result.size(), 1);
    BOOST_CHECK_EQUAL(result.replacement("ISO2"), "OPEN3 OPEN2 ISO1 CLOSE2 CLOSE3");
  }

  {
    const substitution_type result("x OPEN2 y OPEN3 CLOSE3 a CLOSE2 b");
    BOOST_CHECK_EQUAL(result.substituted, "x OPEN2 y ISO1 a CLOSE2 b");
    BOOST_CHECK_EQUAL(result.size(), 1);
    BOOST_CHECK_EQUAL(result.replacement("ISO1"), "OPEN3 CLOSE3");
  }

  {
    const substitution_type result("x OPEN1 y CLOSE1 z");
    BOOST_CHECK_EQUAL(result.substituted, "x OPEN1 y CLOSE1 z");
    BOOST_CHECK(result.pairs.empty());
  }
}

BOOST_AUTO_TEST_CASE(empty_tag_pairs_restore)
{
  const transins::tokens_type source = tokens("x OPEN3 CLOSE3 y");

  transins::EmptyTagPairs pairs;
  transins::tokens_type substituted;
  pairs.substitute(source, transins::TagMap(source), substituted);

  // the isolated tag has moved in the translation
  transins::tokens_type restored;
  pairs.restore(tokens("ISO1 a b"), restored);
  BOOST_CHECK_EQUAL(names(restored), "OPEN3 CLOSE3 a b");

  // unknown isolated tags are kept
  pairs.restore(tokens("ISO2 a b"), restored);
  BOOST_CHECK_EQUAL(names(restored), "ISO2 a b");

  pairs.clear();
  BOOST_CHECK(pairs.empty());
}
