//
//  Copyright(C) 2020 transins developers
//

#include <stdexcept>
#include <set>

#include "markup_reinserter.hpp"
#include "error.hpp"
#include "cleanup.hpp"
#include "tag.hpp"
#include "tag_map.hpp"
#include "test_tags.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE markup_reinserter_test

#include <boost/test/unit_test.hpp>

using transins::test::tokens;
using transins::test::names;

std::string reinsert(const transins::MarkupReinserter& reinserter,
		     const std::string& source,
		     const std::string& target,
		     const std::string& alignment)
{
  transins::tokens_type output;
  reinserter(tokens(source), tokens(target), *transins::Alignment::create(alignment), output);
  return names(output);
}

BOOST_AUTO_TEST_CASE(markup_reinserter_strategies)
{
  const std::string source = "ISO1 OPEN1 This CLOSE1 is a OPEN2 test . CLOSE2 ISO2";
  const std::string target = "Das ist ein Test .";
  const std::string tagged = "ISO1 OPEN1 Das CLOSE1 ist ein OPEN2 Test . CLOSE2 ISO2";

  const std::string alignment = "0-0 1-1 2-2 3-3 4-4 5-5";

  BOOST_CHECK_EQUAL(reinsert(transins::MarkupReinserter(transins::MarkupReinserter::BASELINE), source, target, alignment), tagged);
  BOOST_CHECK_EQUAL(reinsert(transins::MarkupReinserter(transins::MarkupReinserter::IMPROVED), source, target, alignment), tagged);
  BOOST_CHECK_EQUAL(reinsert(transins::MarkupReinserter(transins::MarkupReinserter::COMPLETE_MAPPING), source, target, alignment), tagged);

  // neighbouring pairs of the same tag are merged
  BOOST_CHECK_EQUAL(reinsert(transins::MarkupReinserter(), source, "Test ein ist das .", "0-3 1-2 2-1 3-0 4-4 5-5"),
		    "ISO1 OPEN2 Test CLOSE2 ein ist OPEN1 das CLOSE1 OPEN2 . CLOSE2 ISO2");
}

BOOST_AUTO_TEST_CASE(markup_reinserter_unused)
{
  const transins::MarkupReinserter reinserter;

  transins::tokens_type output;
  transins::tokens_type unused;

  reinserter(tokens("a OPEN1 b CLOSE1 c ISO1 d"), tokens("x y z"), *transins::Alignment::create(""), output, unused);

  BOOST_CHECK_EQUAL(names(output), "x y z ISO1 OPEN1 CLOSE1");
  BOOST_CHECK_EQUAL(names(unused), "ISO1 OPEN1 CLOSE1");
}

BOOST_AUTO_TEST_CASE(markup_reinserter_empty_pairs)
{
  const transins::MarkupReinserter reinserter;

  BOOST_CHECK_EQUAL(reinsert(reinserter, "a OPEN3 CLOSE3 b", "x y", "0-0 1-1"), "x OPEN3 CLOSE3 y");
}

BOOST_AUTO_TEST_CASE(markup_reinserter_fragments)
{
  const transins::MarkupReinserter reinserter;

  BOOST_CHECK_EQUAL(reinsert(reinserter, "OPEN1 This CLOSE1 is", "Da@@ s ist", "0-0 0-1 1-2"), "OPEN1 Das CLOSE1 ist");
}

BOOST_AUTO_TEST_CASE(markup_reinserter_inconsistent)
{
  const transins::MarkupReinserter reinserter;

  transins::tokens_type output;
  BOOST_CHECK_THROW(reinserter(tokens("a CLOSE1 b"), tokens("x y"), *transins::Alignment::create("0-0 1-1"), output),
		    transins::MarkupInconsistency);
}

BOOST_AUTO_TEST_CASE(markup_reinserter_parse_strategy)
{
  BOOST_CHECK_EQUAL(transins::MarkupReinserter::parse_strategy("baseline"), transins::MarkupReinserter::BASELINE);
  BOOST_CHECK_EQUAL(transins::MarkupReinserter::parse_strategy("mtrain"), transins::MarkupReinserter::BASELINE);
  BOOST_CHECK_EQUAL(transins::MarkupReinserter::parse_strategy("Improved"), transins::MarkupReinserter::IMPROVED);
  BOOST_CHECK_EQUAL(transins::MarkupReinserter::parse_strategy("mtrain-improved"), transins::MarkupReinserter::IMPROVED);
  BOOST_CHECK_EQUAL(transins::MarkupReinserter::parse_strategy("complete"), transins::MarkupReinserter::COMPLETE_MAPPING);
  BOOST_CHECK_EQUAL(transins::MarkupReinserter::parse_strategy("COMPLETE-MAPPING"), transins::MarkupReinserter::COMPLETE_MAPPING);

  BOOST_CHECK_THROW(transins::MarkupReinserter::parse_strategy("identity"), std::runtime_error);

  BOOST_CHECK_EQUAL(std::string(transins::MarkupReinserter::name(transins::MarkupReinserter::IMPROVED)), "improved");
  BOOST_CHECK_EQUAL(transins::MarkupReinserter::parse_strategy(transins::MarkupReinserter::name(transins::MarkupReinserter::COMPLETE_MAPPING)),
		    transins::MarkupReinserter::COMPLETE_MAPPING);
}

BOOST_AUTO_TEST_CASE(markup_reinserter_sentence_alignment)
{
  const std::string dump = transins::MarkupReinserter::sentence_alignment(tokens("OPEN1 This CLOSE1 is"),
									    tokens("Das ist"),
									    *transins::Alignment::create("0-0 1-1"));

  BOOST_CHECK(dump.find("0-0 1-1") != std::string::npos);
  BOOST_CHECK(dump.find(" 0 -> 0:This") != std::string::npos);
  BOOST_CHECK(dump.find(" 1 -> 1:is") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(markup_reinserter_complete_mapping)
{
  const transins::MarkupReinserter reinserter(transins::MarkupReinserter::COMPLETE_MAPPING);

  BOOST_CHECK_EQUAL(reinsert(reinserter, "x OPEN1 y CLOSE1 z", "Y", "1-0"), "OPEN1 Y CLOSE1");
}

struct sample_type
{
  const char* source;
  const char* target;
  const char* alignment;
};

const sample_type samples[] = {
  {"ISO1 OPEN1 This CLOSE1 is a OPEN2 test . CLOSE2 ISO2", "Test ein ist das .", "0-3 1-2 2-1 3-0 4-4 5-5"},
  {"ISO1 OPEN1 This CLOSE1 is a OPEN2 test . CLOSE2 ISO2", "Das ist ein Test .", "0-0 2-2 4-3"},
  {"a OPEN1 b CLOSE1 c ISO1 d", "x y z", ""},
  {"a OPEN1 b CLOSE1 c ISO1 d", "x y z", "0-2 2-0"},
  {"OPEN1 x y z CLOSE1 a b c", "X1 N Z X2 N N", "0-0 0-3 2-2"},
  {"OPEN1 OPEN2 x CLOSE2 y z a CLOSE1 b ISO2 c", "A B C", "1-0 2-1"},
  {"a OPEN3 CLOSE3 b OPEN1 c CLOSE1", "x y z", "2-0 0-2"},
  {"OPEN1 This CLOSE1 is", "Da@@ s ist", "1-0 0-2"},
};

const transins::MarkupReinserter::strategy_type strategies[] = {
  transins::MarkupReinserter::BASELINE,
  transins::MarkupReinserter::IMPROVED,
  transins::MarkupReinserter::COMPLETE_MAPPING,
};

typedef std::set<transins::token_type> tag_set_type;

tag_set_type tag_set(const transins::tokens_type& tokens)
{
  tag_set_type tags;
  transins::tokens_type::const_iterator titer_end = tokens.end();
  for (transins::tokens_type::const_iterator titer = tokens.begin(); titer != titer_end; ++ titer)
    if (transins::Tag::is_tag(*titer))
      tags.insert(*titer);
  return tags;
}

BOOST_AUTO_TEST_CASE(markup_reinserter_tag_conservation)
{
  for (size_t strategy = 0; strategy != sizeof(strategies) / sizeof(strategies[0]); ++ strategy)
    for (size_t i = 0; i != sizeof(samples) / sizeof(samples[0]); ++ i) {
      const transins::MarkupReinserter reinserter(strategies[strategy]);

      const transins::tokens_type source = tokens(samples[i].source);

      transins::tokens_type output;
      reinserter(source, tokens(samples[i].target), *transins::Alignment::create(samples[i].alignment), output);

      // every source tag is placed, and no other tag
      const tag_set_type expected = tag_set(source);
      const tag_set_type reinserted = tag_set(output);

      BOOST_CHECK_MESSAGE(expected == reinserted,
			  transins::MarkupReinserter::name(strategies[strategy]) << ": " << samples[i].source
			  << " => " << names(output));
    }
}

BOOST_AUTO_TEST_CASE(markup_reinserter_idempotent)
{
  for (size_t strategy = 0; strategy != sizeof(strategies) / sizeof(strategies[0]); ++ strategy)
    for (size_t i = 0; i != sizeof(samples) / sizeof(samples[0]); ++ i) {
      const transins::MarkupReinserter reinserter(strategies[strategy]);

      const transins::tokens_type source = tokens(samples[i].source);
      const transins::TagMap tag_map(source);

      transins::tokens_type output;
      reinserter(source, tokens(samples[i].target), *transins::Alignment::create(samples[i].alignment), output);

      // the cleanup once more
      transins::tokens_type defragmented;
      transins::cleanup::defragment(output, tag_map, defragmented);

      transins::tokens_type cleaned;
      transins::cleanup::merge_fragments(defragmented, cleaned);

      transins::cleanup::repair_inversions(tag_map, cleaned);
      if (strategies[strategy] != transins::MarkupReinserter::COMPLETE_MAPPING)
	transins::cleanup::remove_redundant(tag_map, cleaned);
      transins::cleanup::balance(tag_map, cleaned);
      transins::cleanup::merge_neighbors(tag_map, cleaned);

      BOOST_CHECK_MESSAGE(cleaned == output,
			  transins::MarkupReinserter::name(strategies[strategy]) << ": " << names(output)
			  << " => " << names(cleaned));
    }
}
