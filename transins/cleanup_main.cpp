//
//  Copyright(C) 2020 transins developers
//

#include "cleanup.hpp"
#include "test_tags.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE cleanup_test

#include <boost/test/unit_test.hpp>

using transins::test::tokens;
using transins::test::names;
using transins::test::tag_map;

std::string defragment(const std::string& x)
{
  transins::tokens_type defragmented;
  transins::cleanup::defragment(tokens(x), tag_map(), defragmented);
  return names(defragmented);
}

std::string merge_fragments(const std::string& x)
{
  transins::tokens_type merged;
  transins::cleanup::merge_fragments(tokens(x), merged);
  return names(merged);
}

std::string repair_inversions(const std::string& x)
{
  transins::tokens_type repaired = tokens(x);
  transins::cleanup::repair_inversions(tag_map(), repaired);
  return names(repaired);
}

std::string remove_redundant(const std::string& x)
{
  transins::tokens_type removed = tokens(x);
  transins::cleanup::remove_redundant(tag_map(), removed);
  return names(removed);
}

std::string balance(const std::string& x)
{
  transins::tokens_type balanced = tokens(x);
  transins::cleanup::balance(tag_map(), balanced);
  return names(balanced);
}

std::string merge_neighbors(const std::string& x)
{
  transins::tokens_type merged = tokens(x);
  transins::cleanup::merge_neighbors(tag_map(), merged);
  return names(merged);
}

std::string collect_unused(const std::string& source, const std::string& target)
{
  transins::tokens_type unused;
  transins::cleanup::collect_unused(tokens(source), tokens(target), unused);
  return names(unused);
}

BOOST_AUTO_TEST_CASE(cleanup_defragment)
{
  BOOST_CHECK_EQUAL(defragment("a b c@@ OPEN1 x y z"), "a b OPEN1 c@@ x y z");
  BOOST_CHECK_EQUAL(defragment("a b@@ c@@ OPEN1 x y z"), "a OPEN1 b@@ c@@ x y z");
  BOOST_CHECK_EQUAL(defragment("a@@ b@@ c@@ OPEN1 x y z"), "OPEN1 a@@ b@@ c@@ x y z");
  BOOST_CHECK_EQUAL(defragment("a@@ b c@@ OPEN1 x y z"), "a@@ b OPEN1 c@@ x y z");

  BOOST_CHECK_EQUAL(defragment("a b c@@ CLOSE1 x y z"), "a b c@@ x CLOSE1 y z");
  BOOST_CHECK_EQUAL(defragment("a b c@@ CLOSE1 x@@ y z"), "a b c@@ x@@ y CLOSE1 z");
  BOOST_CHECK_EQUAL(defragment("a b c@@ CLOSE1 x@@ y@@ z"), "a b c@@ x@@ y@@ z CLOSE1");
  BOOST_CHECK_EQUAL(defragment("a b c@@ CLOSE1 x y@@ z"), "a b c@@ x CLOSE1 y@@ z");

  BOOST_CHECK_EQUAL(defragment("a b c@@ OPEN1 CLOSE1 x y@@ z"), "a b OPEN1 c@@ x CLOSE1 y@@ z");
  BOOST_CHECK_EQUAL(defragment("a b c@@ CLOSE1 OPEN1 x y@@ z"), "a b OPEN1 c@@ x CLOSE1 y@@ z");
  BOOST_CHECK_EQUAL(defragment("a OPEN1 b@@ OPEN2 OPEN3 CLOSE2 CLOSE3 c CLOSE1"), "a OPEN1 OPEN2 OPEN3 b@@ c CLOSE3 CLOSE2 CLOSE1");
  BOOST_CHECK_EQUAL(defragment("a OPEN1 b@@ CLOSE2 CLOSE3 OPEN2 OPEN3 c CLOSE1"), "a OPEN1 OPEN2 OPEN3 b@@ c CLOSE3 CLOSE2 CLOSE1");
  BOOST_CHECK_EQUAL(defragment("a@@ OPEN1 CLOSE1 b c"), "OPEN1 a@@ b CLOSE1 c");
  BOOST_CHECK_EQUAL(defragment("a b@@ OPEN1 CLOSE1 c"), "a OPEN1 b@@ c CLOSE1");
  BOOST_CHECK_EQUAL(defragment("a OPEN1 b@@ CLOSE1 OPEN2 c CLOSE2"), "a OPEN1 OPEN2 b@@ c CLOSE2 CLOSE1");

  BOOST_CHECK_EQUAL(defragment("a OPEN1 b CLOSE1 c"), "a OPEN1 b CLOSE1 c");
}

BOOST_AUTO_TEST_CASE(cleanup_merge_fragments)
{
  BOOST_CHECK_EQUAL(merge_fragments("a b@@ c@@ d x"), "a bcd x");
  BOOST_CHECK_EQUAL(merge_fragments("b@@ c@@ d x"), "bcd x");
  BOOST_CHECK_EQUAL(merge_fragments("a b@@ c@@ d"), "a bcd");
  BOOST_CHECK_EQUAL(merge_fragments("OPEN1 b@@ c CLOSE1"), "OPEN1 bc CLOSE1");

  // unfinished words
  BOOST_CHECK_EQUAL(merge_fragments("a b@@ OPEN1 c CLOSE1"), "a b OPEN1 c CLOSE1");
  BOOST_CHECK_EQUAL(merge_fragments("a b@@"), "a b");
}

BOOST_AUTO_TEST_CASE(cleanup_repair_inversions)
{
  BOOST_CHECK_EQUAL(repair_inversions("x CLOSE1 y"), "x y");
  BOOST_CHECK_EQUAL(repair_inversions("x CLOSE1 y CLOSE1 z"), "x y z");
  BOOST_CHECK_EQUAL(repair_inversions("x CLOSE1 y CLOSE2 z"), "x y z");
  BOOST_CHECK_EQUAL(repair_inversions("CLOSE1 x y"), "x y");
  BOOST_CHECK_EQUAL(repair_inversions("CLOSE1 CLOSE1 x y"), "x y");
  BOOST_CHECK_EQUAL(repair_inversions("x y CLOSE1"), "x y");
  BOOST_CHECK_EQUAL(repair_inversions("x y CLOSE1 CLOSE1"), "x y");

  BOOST_CHECK_EQUAL(repair_inversions("x CLOSE1 y OPEN1 z"), "OPEN1 x y z CLOSE1");
  BOOST_CHECK_EQUAL(repair_inversions("CLOSE1 x y OPEN1 z"), "OPEN1 x y z CLOSE1");
  BOOST_CHECK_EQUAL(repair_inversions("x CLOSE1 y z OPEN1"), "OPEN1 x y z CLOSE1");

  BOOST_CHECK_EQUAL(repair_inversions("x CLOSE1 y OPEN1 z a CLOSE1 b OPEN1 c"), "OPEN1 x y z CLOSE1 OPEN1 a b c CLOSE1");
  BOOST_CHECK_EQUAL(repair_inversions("x CLOSE1 y OPEN1 z CLOSE1 a OPEN1 b c"), "OPEN1 x y OPEN1 z CLOSE1 a b CLOSE1 c");
  BOOST_CHECK_EQUAL(repair_inversions("x CLOSE1 y CLOSE2 z a OPEN2 b OPEN1 c"), "OPEN1 x OPEN2 y z a b CLOSE2 c CLOSE1");
  BOOST_CHECK_EQUAL(repair_inversions("x CLOSE1 y OPEN1 z OPEN1 a CLOSE1 b"), "OPEN1 x y z CLOSE1 OPEN1 a CLOSE1 b");
  BOOST_CHECK_EQUAL(repair_inversions("x OPEN1 y CLOSE1 z a CLOSE1 b OPEN1 c"), "x OPEN1 y CLOSE1 z OPEN1 a b c CLOSE1");

  BOOST_CHECK_EQUAL(repair_inversions("ISO1 Das CLOSE1 OPEN1 ist OPEN2 ein Test . CLOSE2 ISO1"),
		    "ISO1 OPEN1 Das ist CLOSE1 OPEN2 ein Test . CLOSE2 ISO1");
}

BOOST_AUTO_TEST_CASE(cleanup_remove_redundant)
{
  BOOST_CHECK_EQUAL(remove_redundant("x OPEN1 y"), "x y");
  BOOST_CHECK_EQUAL(remove_redundant("x OPEN1 y OPEN1"), "x y");
  BOOST_CHECK_EQUAL(remove_redundant("x OPEN1 y OPEN1 z CLOSE1 a b CLOSE1 c"), "x OPEN1 y z a b CLOSE1 c");
  BOOST_CHECK_EQUAL(remove_redundant("x OPEN1 y OPEN1 z CLOSE1 a b c"), "x OPEN1 y z CLOSE1 a b c");
  BOOST_CHECK_EQUAL(remove_redundant("x OPEN1 y z CLOSE1 a b CLOSE1 c"), "x OPEN1 y z a b CLOSE1 c");
  BOOST_CHECK_EQUAL(remove_redundant("x OPEN1 y z CLOSE1 a b CLOSE1 c CLOSE1 d"), "x OPEN1 y z a b c CLOSE1 d");
  BOOST_CHECK_EQUAL(remove_redundant("x OPEN1 y OPEN1 z CLOSE1 a b CLOSE1 c OPEN1 i j CLOSE1 k"),
		    "x OPEN1 y z a b CLOSE1 c OPEN1 i j CLOSE1 k");
  BOOST_CHECK_EQUAL(remove_redundant("x OPEN1 y OPEN1 z OPEN2 a b OPEN2 c CLOSE2 i CLOSE1 j CLOSE1 k"),
		    "x OPEN1 y z OPEN2 a b c CLOSE2 i j CLOSE1 k");
  BOOST_CHECK_EQUAL(remove_redundant("x OPEN1 y OPEN1 z OPEN2 a b OPEN2 c CLOSE1 i CLOSE1 j CLOSE2 k"),
		    "x OPEN1 y z OPEN2 a b c i CLOSE1 j CLOSE2 k");
}

BOOST_AUTO_TEST_CASE(cleanup_balance)
{
  BOOST_CHECK_EQUAL(balance("x OPEN1 OPEN2 y z CLOSE1 a CLOSE2"), "x OPEN2 OPEN1 y z CLOSE1 a CLOSE2");
  BOOST_CHECK_EQUAL(balance("x OPEN1 y z CLOSE1 a"), "x OPEN1 y z CLOSE1 a");
  BOOST_CHECK_EQUAL(balance("OPEN1 OPEN2 x y CLOSE1 a CLOSE2"), "OPEN2 OPEN1 x y CLOSE1 a CLOSE2");
  BOOST_CHECK_EQUAL(balance("x OPEN1 y OPEN2 z a CLOSE1 CLOSE2 b"), "x OPEN1 y OPEN2 z a CLOSE2 CLOSE1 b");
  BOOST_CHECK_EQUAL(balance("x OPEN1 y OPEN2 z a CLOSE1 CLOSE2"), "x OPEN1 y OPEN2 z a CLOSE2 CLOSE1");
  BOOST_CHECK_EQUAL(balance("x OPEN1 y z a CLOSE1"), "x OPEN1 y z a CLOSE1");

  BOOST_CHECK_EQUAL(balance("x OPEN1 y OPEN2 z CLOSE1 a CLOSE2"), "x OPEN1 y OPEN2 z CLOSE2 CLOSE1 OPEN2 a CLOSE2");
  BOOST_CHECK_EQUAL(balance("x OPEN1 y OPEN2 z OPEN3 a CLOSE1 b CLOSE2 c CLOSE3"),
		    "x OPEN1 y OPEN2 z OPEN3 a CLOSE3 CLOSE2 CLOSE1 OPEN2 OPEN3 b CLOSE3 CLOSE2 OPEN3 c CLOSE3");

  // dangling tags
  BOOST_CHECK_EQUAL(balance("x CLOSE1 y"), "x y");
  BOOST_CHECK_EQUAL(balance("x OPEN1 y"), "x OPEN1 y CLOSE1");
}

BOOST_AUTO_TEST_CASE(cleanup_merge_neighbors)
{
  BOOST_CHECK_EQUAL(merge_neighbors("x OPEN1 y CLOSE1 OPEN1 z CLOSE1 a b c"), "x OPEN1 y z CLOSE1 a b c");
  BOOST_CHECK_EQUAL(merge_neighbors("x OPEN1 y CLOSE1 OPEN1 z CLOSE1"), "x OPEN1 y z CLOSE1");
  BOOST_CHECK_EQUAL(merge_neighbors("x OPEN1 y CLOSE1 OPEN1 z CLOSE1 OPEN1 a b CLOSE1 c"), "x OPEN1 y z a b CLOSE1 c");
  BOOST_CHECK_EQUAL(merge_neighbors("x OPEN1 y CLOSE1 OPEN1 z CLOSE1 OPEN2 a CLOSE2 OPEN2 b CLOSE2 c"),
		    "x OPEN1 y z CLOSE1 OPEN2 a b CLOSE2 c");
  BOOST_CHECK_EQUAL(merge_neighbors("x OPEN1 OPEN2 y CLOSE2 CLOSE1 OPEN1 OPEN2 z CLOSE2 CLOSE1 c"),
		    "x OPEN1 OPEN2 y z CLOSE2 CLOSE1 c");
  BOOST_CHECK_EQUAL(merge_neighbors("x OPEN1 OPEN2 OPEN3 y CLOSE3 CLOSE2 CLOSE1 OPEN1 OPEN2 OPEN3 z CLOSE3 CLOSE2 CLOSE1 c"),
		    "x OPEN1 OPEN2 OPEN3 y z CLOSE3 CLOSE2 CLOSE1 c");
}

BOOST_AUTO_TEST_CASE(cleanup_collect_unused)
{
  BOOST_CHECK_EQUAL(collect_unused("ISO1 a OPEN1 b CLOSE1 c ISO2", "ISO1 x OPEN1 y CLOSE1 z ISO2"), "");
  BOOST_CHECK_EQUAL(collect_unused("ISO1 a OPEN1 b CLOSE1 c ISO2", "ISO1 x OPEN1 y CLOSE1 OPEN1 z CLOSE1 ISO2"), "");
  BOOST_CHECK_EQUAL(collect_unused("ISO1 a OPEN1 b CLOSE1 c ISO2", "ISO1 x OPEN1 y z ISO2"), "CLOSE1");
  BOOST_CHECK_EQUAL(collect_unused("ISO1 a OPEN1 b CLOSE1 c ISO2", "x y z"), "ISO1 OPEN1 CLOSE1 ISO2");
}

BOOST_AUTO_TEST_CASE(cleanup_clean_input)
{
  const std::string clean = "ISO1 OPEN1 Das CLOSE1 ist ein OPEN2 Test . CLOSE2 ISO2";

  BOOST_CHECK_EQUAL(defragment(clean), clean);
  BOOST_CHECK_EQUAL(merge_fragments(clean), clean);
  BOOST_CHECK_EQUAL(repair_inversions(clean), clean);
  BOOST_CHECK_EQUAL(remove_redundant(clean), clean);
  BOOST_CHECK_EQUAL(balance(clean), clean);
  BOOST_CHECK_EQUAL(merge_neighbors(clean), clean);

  // each pass is idempotent
  const std::string crossing = "x OPEN1 y OPEN2 z CLOSE1 a CLOSE2";

  BOOST_CHECK_EQUAL(balance(balance(crossing)), balance(crossing));
  BOOST_CHECK_EQUAL(repair_inversions(repair_inversions("x CLOSE1 y OPEN1 z")), repair_inversions("x CLOSE1 y OPEN1 z"));
  BOOST_CHECK_EQUAL(merge_neighbors(merge_neighbors("x OPEN1 y CLOSE1 OPEN1 z CLOSE1")), "x OPEN1 y z CLOSE1");
}
