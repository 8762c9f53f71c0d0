//
//  Copyright(C) 2020 transins developers
//

#include "sentence_splitter.hpp"
#include "test_tags.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE sentence_splitter_test

#include <boost/test/unit_test.hpp>

struct split_type
{
  std::string tokens;
  std::string beginning;
  std::string end;
};

split_type split_sentence(const std::string& tokens)
{
  transins::SplitSentence sentence;
  transins::SentenceSplitter()(transins::test::tokens(tokens), transins::test::tag_map(), sentence);

  split_type result;
  result.tokens    = transins::test::names(sentence.tokens);
  result.beginning = transins::test::names(sentence.beginning);
  result.end       = transins::test::names(sentence.end);

  BOOST_CHECK_EQUAL(transins::test::names(sentence.tokens_without_tags),
		    transins::test::names(transins::remove_tags(sentence.tokens)));

  return result;
}

BOOST_AUTO_TEST_CASE(split_tag_pairs)
{
  split_type result;

  result = split_sentence("OPEN1 x y z CLOSE1");
  BOOST_CHECK_EQUAL(result.tokens, "x y z");
  BOOST_CHECK_EQUAL(result.beginning, "OPEN1");
  BOOST_CHECK_EQUAL(result.end, "CLOSE1");

  result = split_sentence("OPEN1 OPEN2 x y z CLOSE2 CLOSE1");
  BOOST_CHECK_EQUAL(result.tokens, "x y z");
  BOOST_CHECK_EQUAL(result.beginning, "OPEN1 OPEN2");
  BOOST_CHECK_EQUAL(result.end, "CLOSE2 CLOSE1");

  result = split_sentence("x OPEN1 y z CLOSE1");
  BOOST_CHECK_EQUAL(result.tokens, "x OPEN1 y z CLOSE1");
  BOOST_CHECK_EQUAL(result.beginning, "");
  BOOST_CHECK_EQUAL(result.end, "");

  result = split_sentence("OPEN1 x y CLOSE1 z");
  BOOST_CHECK_EQUAL(result.tokens, "OPEN1 x y CLOSE1 z");
  BOOST_CHECK_EQUAL(result.beginning, "");
  BOOST_CHECK_EQUAL(result.end, "");

  result = split_sentence("x OPEN1 y CLOSE1 z");
  BOOST_CHECK_EQUAL(result.tokens, "x OPEN1 y CLOSE1 z");
  BOOST_CHECK_EQUAL(result.beginning, "");
  BOOST_CHECK_EQUAL(result.end, "");
}

BOOST_AUTO_TEST_CASE(split_isolated)
{
  split_type result;

  result = split_sentence("ISO1 x y z");
  BOOST_CHECK_EQUAL(result.tokens, "x y z");
  BOOST_CHECK_EQUAL(result.beginning, "ISO1");
  BOOST_CHECK_EQUAL(result.end, "");

  result = split_sentence("x ISO1 y z");
  BOOST_CHECK_EQUAL(result.tokens, "x ISO1 y z");
  BOOST_CHECK_EQUAL(result.beginning, "");
  BOOST_CHECK_EQUAL(result.end, "");

  result = split_sentence("x y z ISO1");
  BOOST_CHECK_EQUAL(result.tokens, "x y z");
  BOOST_CHECK_EQUAL(result.beginning, "");
  BOOST_CHECK_EQUAL(result.end, "ISO1");

  result = split_sentence("ISO1 x y z ISO2");
  BOOST_CHECK_EQUAL(result.tokens, "x y z");
  BOOST_CHECK_EQUAL(result.beginning, "ISO1");
  BOOST_CHECK_EQUAL(result.end, "ISO2");

  result = split_sentence("x ISO1 y ISO2 z");
  BOOST_CHECK_EQUAL(result.tokens, "x ISO1 y ISO2 z");
  BOOST_CHECK_EQUAL(result.beginning, "");
  BOOST_CHECK_EQUAL(result.end, "");
}

BOOST_AUTO_TEST_CASE(split_mixed)
{
  split_type result;

  result = split_sentence("ISO1 OPEN1 x y z CLOSE1");
  BOOST_CHECK_EQUAL(result.tokens, "x y z");
  BOOST_CHECK_EQUAL(result.beginning, "ISO1 OPEN1");
  BOOST_CHECK_EQUAL(result.end, "CLOSE1");

  result = split_sentence("OPEN1 ISO1 x y z CLOSE1");
  BOOST_CHECK_EQUAL(result.tokens, "x y z");
  BOOST_CHECK_EQUAL(result.beginning, "OPEN1 ISO1");
  BOOST_CHECK_EQUAL(result.end, "CLOSE1");

  result = split_sentence("OPEN1 x y z CLOSE1 ISO1");
  BOOST_CHECK_EQUAL(result.tokens, "x y z");
  BOOST_CHECK_EQUAL(result.beginning, "OPEN1");
  BOOST_CHECK_EQUAL(result.end, "CLOSE1 ISO1");

  result = split_sentence("OPEN1 x y z ISO1 CLOSE1");
  BOOST_CHECK_EQUAL(result.tokens, "x y z");
  BOOST_CHECK_EQUAL(result.beginning, "OPEN1");
  BOOST_CHECK_EQUAL(result.end, "ISO1 CLOSE1");

  result = split_sentence("x OPEN1 y z ISO1 CLOSE1");
  BOOST_CHECK_EQUAL(result.tokens, "x OPEN1 y z CLOSE1");
  BOOST_CHECK_EQUAL(result.beginning, "");
  BOOST_CHECK_EQUAL(result.end, "ISO1");
}

BOOST_AUTO_TEST_CASE(split_empty_pairs)
{
  split_type result;

  result = split_sentence("OPEN1 CLOSE1 x y z");
  BOOST_CHECK_EQUAL(result.tokens, "x y z");
  BOOST_CHECK_EQUAL(result.beginning, "OPEN1 CLOSE1");
  BOOST_CHECK_EQUAL(result.end, "");

  result = split_sentence("x y z OPEN1 CLOSE1");
  BOOST_CHECK_EQUAL(result.tokens, "x y z");
  BOOST_CHECK_EQUAL(result.beginning, "");
  BOOST_CHECK_EQUAL(result.end, "OPEN1 CLOSE1");
}

BOOST_AUTO_TEST_CASE(split_tags_only)
{
  split_type result;

  result = split_sentence("ISO1 OPEN1 CLOSE1");
  BOOST_CHECK_EQUAL(result.tokens, "");
  BOOST_CHECK_EQUAL(result.beginning, "ISO1 OPEN1 CLOSE1");
  BOOST_CHECK_EQUAL(result.end, "");

  result = split_sentence("");
  BOOST_CHECK_EQUAL(result.tokens, "");
  BOOST_CHECK_EQUAL(result.beginning, "");
}

BOOST_AUTO_TEST_CASE(split_none)
{
  const transins::SplitSentence sentence(transins::test::tokens("OPEN1 x y CLOSE1"));

  BOOST_CHECK_EQUAL(transins::test::names(sentence.tokens), "OPEN1 x y CLOSE1");
  BOOST_CHECK_EQUAL(transins::test::names(sentence.tokens_without_tags), "x y");
  BOOST_CHECK(sentence.beginning.empty());
  BOOST_CHECK(sentence.end.empty());
}
