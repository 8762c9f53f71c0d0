//
//  Copyright(C) 2020 transins developers
//

#include "baseline.hpp"
#include "improved.hpp"
#include "complete_mapping.hpp"
#include "pointed.hpp"

#include "transins/alignment/probabilistic.hpp"

#include "transins/test_tags.hpp"

#include <boost/lexical_cast.hpp>

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE reinserter_test

#include <boost/test/unit_test.hpp>

using transins::test::tokens;
using transins::test::names;
using transins::test::tag;

template <typename Strategy>
std::string reinsert(const Strategy& strategy,
		     const std::string& source,
		     const std::string& target,
		     const std::string& alignment)
{
  const transins::tokens_type source_tokens = tokens(source);
  const transins::TagMap tag_map(source_tokens);

  transins::SplitSentence sentence;
  if (Strategy::split_boundaries)
    transins::SentenceSplitter()(source_tokens, tag_map, sentence);
  else
    sentence.assign(source_tokens);

  const transins::Alignment::alignment_ptr_type aligned = transins::Alignment::create(alignment);

  transins::TagIndex  index;
  transins::tokens_type unused;
  strategy.index(sentence, tag_map, *aligned, index, unused);

  transins::tokens_type output;
  strategy.reinsert(sentence, index, tokens(target), *aligned, output);

  return names(output);
}

// the index of a source sentence, as "pos:tags" for non-empty slots
template <typename Strategy>
std::string index_slots(const Strategy& strategy,
		  const std::string& source,
		  const std::string& alignment,
		  std::string& unused)
{
  const transins::tokens_type source_tokens = tokens(source);
  const transins::TagMap tag_map(source_tokens);

  transins::SplitSentence sentence;
  transins::SentenceSplitter()(source_tokens, tag_map, sentence);

  const transins::Alignment::alignment_ptr_type aligned = transins::Alignment::create(alignment);

  transins::TagIndex  index;
  transins::tokens_type unused_tags;
  strategy.index(sentence, tag_map, *aligned, index, unused_tags);

  unused = names(unused_tags);

  std::string slots;
  for (transins::TagIndex::index_type pos = 0; pos != transins::TagIndex::index_type(index.size()); ++ pos)
    if (! index[pos].empty()) {
      if (! slots.empty())
	slots += " | ";
      slots += boost::lexical_cast<std::string>(pos) + ':' + names(index[pos]);
    }
  return slots;
}

const char* parallel_soft = "\
1,0,0,0,0,0 \
0,1,0,0,0,0 \
0,0,1,0,0,0 \
0,0,0,1,0,0 \
0,0,0,0,1,0 \
0,0,0,0,0,1";

const char* reversed_soft = "\
0,0,0,1,0,0 \
0,0,1,0,0,0 \
0,1,0,0,0,0 \
1,0,0,0,0,0 \
0,0,0,0,1,0 \
0,0,0,0,0,1";

BOOST_AUTO_TEST_CASE(baseline_reinsert)
{
  const transins::reinserter::Baseline baseline;

  const std::string source = "ISO1 OPEN1 This CLOSE1 is a OPEN2 test . CLOSE2 ISO2";

  BOOST_CHECK_EQUAL(reinsert(baseline, source, "Das ist ein Test .", "0-0 1-1 2-2 3-3 4-4 5-5"),
		    "ISO1 OPEN1 Das CLOSE1 ist ein OPEN2 Test . CLOSE2 ISO2");

  // closing tags bind to the following token
  BOOST_CHECK_EQUAL(reinsert(baseline, source, "Test ein ist das .", "0-3 1-2 2-1 3-0 4-4 5-5"),
		    "OPEN2 Test ein CLOSE1 ist ISO1 OPEN1 das . CLOSE2 ISO2");

  // tags of unaligned source tokens are appended
  BOOST_CHECK_EQUAL(reinsert(baseline, "a OPEN1 b CLOSE1 c", "x y z", "0-0 2-2"),
		    "x y CLOSE1 z OPEN1");
}

BOOST_AUTO_TEST_CASE(improved_index)
{
  const transins::reinserter::Improved improved;

  std::string unused;

  BOOST_CHECK_EQUAL(index_slots(improved, "start ISO1 OPEN1 This CLOSE1 is a OPEN2 test . CLOSE2 ISO2 end", "0-0 1-1 2-2 3-3 4-4 5-5 6-6", unused),
		    "1:ISO1 OPEN1 CLOSE1 | 4:OPEN2 | 5:CLOSE2 | 6:ISO2");
  BOOST_CHECK_EQUAL(unused, "");

  BOOST_CHECK_EQUAL(index_slots(improved, "start OPEN1 x y CLOSE1 end", "0-0 1-1 2-2 3-3", unused),
		    "1:OPEN1 | 2:CLOSE1");
  BOOST_CHECK_EQUAL(index_slots(improved, "start OPEN1 x y CLOSE1 OPEN2 a b CLOSE2 end", "0-0 1-1 2-2 3-3 4-4 5-5", unused),
		    "1:OPEN1 | 2:CLOSE1 | 3:OPEN2 | 4:CLOSE2");
  BOOST_CHECK_EQUAL(index_slots(improved, "start OPEN1 OPEN2 x y CLOSE2 CLOSE1 end", "0-0 1-1 2-2 3-3", unused),
		    "1:OPEN1 OPEN2 | 2:CLOSE2 CLOSE1");
  BOOST_CHECK_EQUAL(index_slots(improved, "start OPEN1 ISO1 x y CLOSE1 end", "0-0 1-1 2-2 3-3", unused),
		    "1:OPEN1 ISO1 | 2:CLOSE1");
  BOOST_CHECK_EQUAL(index_slots(improved, "start OPEN1 x ISO1 y CLOSE1 end", "0-0 1-1 2-2 3-3", unused),
		    "1:OPEN1 | 2:ISO1 CLOSE1");
  BOOST_CHECK_EQUAL(index_slots(improved, "start OPEN1 x y ISO1 CLOSE1 end", "0-0 1-1 2-2 3-3", unused),
		    "1:OPEN1 | 2:CLOSE1 | 3:ISO1");
  BOOST_CHECK_EQUAL(index_slots(improved, "start OPEN1 x ISO1 y ISO2 CLOSE1 end", "0-0 1-1 2-2 3-3", unused),
		    "1:OPEN1 | 2:ISO1 CLOSE1 | 3:ISO2");
}

BOOST_AUTO_TEST_CASE(improved_index_pointed)
{
  const transins::reinserter::Improved improved;

  std::string unused;

  // isolated tag of an unpointed token moves to the next pointed one
  BOOST_CHECK_EQUAL(index_slots(improved, "x ISO1 y z", "2-0", unused), "2:ISO1");
  BOOST_CHECK_EQUAL(unused, "");

  BOOST_CHECK_EQUAL(index_slots(improved, "x ISO1 y z", "0-0", unused), "");
  BOOST_CHECK_EQUAL(unused, "ISO1");

  // tag pair spanning unpointed tokens only
  BOOST_CHECK_EQUAL(index_slots(improved, "OPEN1 OPEN2 This CLOSE2 is a CLOSE1 test .", "1-0 2-1", unused),
		    "1:OPEN1 | 2:CLOSE1");
  BOOST_CHECK_EQUAL(unused, "OPEN2 CLOSE2");

  BOOST_CHECK_EQUAL(index_slots(improved, "OPEN1 OPEN2 This CLOSE2 is a CLOSE1 test .", "0-0 1-1 2-2", unused),
		    "0:OPEN1 OPEN2 CLOSE2 | 2:CLOSE1");
  BOOST_CHECK_EQUAL(unused, "");

  BOOST_CHECK_EQUAL(index_slots(improved, "OPEN1 OPEN2 x CLOSE2 y z a CLOSE1 b ISO2 c", "1-0 2-1", unused),
		    "1:OPEN1 | 2:CLOSE1");
  BOOST_CHECK_EQUAL(unused, "OPEN2 CLOSE2 ISO2");
}

BOOST_AUTO_TEST_CASE(improved_source_tags)
{
  const transins::tokens_type source = tokens("start ISO1 OPEN1 Th@@ i@@ s CLOSE1 is a OPEN2 te@@ st . CLOSE2 ISO2 end");
  const transins::TagMap tag_map(source);
  const transins::SplitSentence sentence(source);
  const transins::Alignment::alignment_ptr_type aligned = transins::Alignment::create("0-0 1-1 2-2 3-3 4-4 5-5 6-6 7-7 8-8 9-9");

  transins::TagIndex  index;
  transins::tokens_type unused;
  transins::reinserter::Improved().index(sentence, tag_map, *aligned, index, unused);

  transins::tokens_type tags;

  transins::reinserter::Improved::source_tags(4, index, sentence.tokens_without_tags, tags);
  BOOST_CHECK_EQUAL(names(tags), "");

  transins::reinserter::Improved::source_tags(3, index, sentence.tokens_without_tags, tags);
  BOOST_CHECK_EQUAL(names(tags), "ISO1 OPEN1 CLOSE1");
  transins::reinserter::Improved::source_tags(2, index, sentence.tokens_without_tags, tags);
  BOOST_CHECK_EQUAL(names(tags), "ISO1 OPEN1 CLOSE1");
  transins::reinserter::Improved::source_tags(1, index, sentence.tokens_without_tags, tags);
  BOOST_CHECK_EQUAL(names(tags), "ISO1 OPEN1 CLOSE1");

  transins::reinserter::Improved::source_tags(9, index, sentence.tokens_without_tags, tags);
  BOOST_CHECK_EQUAL(names(tags), "ISO2");

  transins::reinserter::Improved::source_tags(10, index, sentence.tokens_without_tags, tags);
  BOOST_CHECK_EQUAL(names(tags), "");
  transins::reinserter::Improved::source_tags(42, index, sentence.tokens_without_tags, tags);
  BOOST_CHECK_EQUAL(names(tags), "");
}

BOOST_AUTO_TEST_CASE(improved_reinsert)
{
  const transins::reinserter::Improved improved;

  const std::string source = "ISO1 OPEN1 This CLOSE1 is a OPEN2 test . CLOSE2 ISO2";

  BOOST_CHECK_EQUAL(reinsert(improved, source, "Das ist ein Test .", "0-0 1-1 2-2 3-3 4-4 5-5"),
		    "ISO1 OPEN1 Das CLOSE1 ist ein OPEN2 Test . CLOSE2 ISO2");
  BOOST_CHECK_EQUAL(reinsert(improved, source, "Test ein ist das .", "0-3 1-2 2-1 3-0 4-4 5-5"),
		    "ISO1 OPEN2 Test ein ist OPEN1 das CLOSE1 . CLOSE2 ISO2");

  BOOST_CHECK_EQUAL(reinsert(improved, source, "Das ist ein Test .", parallel_soft),
		    "ISO1 OPEN1 Das CLOSE1 ist ein OPEN2 Test . CLOSE2 ISO2");
  BOOST_CHECK_EQUAL(reinsert(improved, source, "Test ein ist das .", reversed_soft),
		    "ISO1 OPEN2 Test ein ist OPEN1 das CLOSE1 . CLOSE2 ISO2");

  // end of sentence aligned to a source token with tags
  BOOST_CHECK_EQUAL(reinsert(improved, "ISO1 OPEN1 Zum Inhalt springen CLOSE1 ISO2", "aller au contenu", "0-0 1-2 2-3"),
		    "ISO1 OPEN1 aller au contenu CLOSE1 ISO2");

  // boundary tags
  BOOST_CHECK_EQUAL(reinsert(improved, "ISO1 OPEN1 a b c d CLOSE1 ISO2", "b a d c", "0-1 1-0 2-3 4-2"),
		    "ISO1 OPEN1 b a d c CLOSE1 ISO2");
  BOOST_CHECK_EQUAL(reinsert(improved, "OPEN1 a b c d CLOSE1", "b a d c", "0-1 1-0 2-3 4-2"),
		    "OPEN1 b a d c CLOSE1");
  BOOST_CHECK_EQUAL(reinsert(improved, "OPEN1 OPEN2 OPEN3 a b c d CLOSE3 CLOSE2 CLOSE1", "b a d c", "0-1 1-0 2-3 4-2"),
		    "OPEN1 OPEN2 OPEN3 b a d c CLOSE3 CLOSE2 CLOSE1");

  // isolated tags are inserted once
  BOOST_CHECK_EQUAL(reinsert(improved, "x ISO1 ISO2 OPEN1 y z CLOSE1", "a b c", "1-0 1-1 2-2"),
		    "ISO1 ISO2 OPEN1 a OPEN1 b c CLOSE1");
  BOOST_CHECK_EQUAL(reinsert(improved, "x ISO1 ISO2 OPEN1 y z CLOSE1", "a b c", "1-0 2-0 2-2"),
		    "ISO1 ISO2 OPEN1 a CLOSE1 b c CLOSE1");

  BOOST_CHECK_EQUAL(reinsert(improved, "x OPEN1 y z ISO1 CLOSE1", "a b c", "0-0 1-1 2-2"),
		    "a OPEN1 b c CLOSE1 ISO1");
  BOOST_CHECK_EQUAL(reinsert(improved, "ISO1 OPEN1 x y CLOSE1 z", "a b c", "0-0 1-1 2-2"),
		    "ISO1 OPEN1 a b CLOSE1 c");
}

BOOST_AUTO_TEST_CASE(improved_reinsert_complex)
{
  const transins::reinserter::Improved improved;

  const std::string source = "OPEN1 x y z CLOSE1 a b c";

  BOOST_CHECK_EQUAL(reinsert(improved, source, "X1 N Z X2 N N", "0-0 0-3 2-2"),
		    "OPEN1 X1 N Z CLOSE1 OPEN1 X2 N N");
  BOOST_CHECK_EQUAL(reinsert(improved, source, "Z1 Z2 X N N N", "0-2 2-0 2-1"),
		    "Z1 CLOSE1 Z2 CLOSE1 OPEN1 X N N N");
  BOOST_CHECK_EQUAL(reinsert(improved, source, "Z1 N X1 Z2 N X2", "0-2 0-5 2-0 2-3"),
		    "Z1 CLOSE1 N OPEN1 X1 Z2 CLOSE1 N OPEN1 X2");
}

BOOST_AUTO_TEST_CASE(complete_mapping_index)
{
  const transins::reinserter::CompleteMapping complete;

  std::string unused;

  BOOST_CHECK_EQUAL(index_slots(complete, "start OPEN1 OPEN2 x y CLOSE2 CLOSE1 end", "0-0 1-1 2-2 3-3", unused),
		    "1:OPEN1 OPEN2 CLOSE2 CLOSE1 | 2:OPEN1 OPEN2 CLOSE2 CLOSE1");

  // isolated tags belong to the following token only
  BOOST_CHECK_EQUAL(index_slots(complete, "x ISO1 ISO2 OPEN1 y z CLOSE1", "0-0 1-1 2-2", unused),
		    "1:ISO1 ISO2 OPEN1 CLOSE1 | 2:OPEN1 CLOSE1");

  BOOST_CHECK_EQUAL(index_slots(complete, "a ISO1 b c", "0-0 2-1", unused), "2:ISO1");
  BOOST_CHECK_EQUAL(unused, "");
  BOOST_CHECK_EQUAL(index_slots(complete, "a ISO1 b c", "0-0", unused), "");
  BOOST_CHECK_EQUAL(unused, "ISO1");
}

BOOST_AUTO_TEST_CASE(complete_mapping_reinsert)
{
  const transins::reinserter::CompleteMapping complete;

  const std::string source = "ISO1 OPEN1 This CLOSE1 is a OPEN2 test . CLOSE2 ISO2";

  BOOST_CHECK_EQUAL(reinsert(complete, source, "Das ist ein Test .", "0-0 1-1 2-2 3-3 4-4 5-5"),
		    "ISO1 OPEN1 Das CLOSE1 ist ein OPEN2 Test CLOSE2 OPEN2 . CLOSE2 ISO2");
  BOOST_CHECK_EQUAL(reinsert(complete, source, "Test ein ist das .", "0-3 1-2 2-1 3-0 4-4 5-5"),
		    "ISO1 OPEN2 Test CLOSE2 ein ist OPEN1 das CLOSE1 OPEN2 . CLOSE2 ISO2");

  BOOST_CHECK_EQUAL(reinsert(complete, source, "Das ist ein Test .", parallel_soft),
		    "ISO1 OPEN1 Das CLOSE1 ist ein OPEN2 Test CLOSE2 OPEN2 . CLOSE2 ISO2");
  BOOST_CHECK_EQUAL(reinsert(complete, source, "Test ein ist das .", reversed_soft),
		    "ISO1 OPEN2 Test CLOSE2 ein ist OPEN1 das CLOSE1 OPEN2 . CLOSE2 ISO2");

  BOOST_CHECK_EQUAL(reinsert(complete, "x ISO1 ISO2 OPEN1 y z CLOSE1", "a b c", "1-0 1-1 2-2"),
		    "ISO1 ISO2 OPEN1 a CLOSE1 OPEN1 b CLOSE1 OPEN1 c CLOSE1");

  BOOST_CHECK_EQUAL(reinsert(complete, "OPEN1 x y z CLOSE1 a b c", "X1 N Z X2 N N", "0-0 0-3 2-2"),
		    "OPEN1 X1 CLOSE1 N OPEN1 Z CLOSE1 OPEN1 X2 CLOSE1 N N");
}

BOOST_AUTO_TEST_CASE(complete_mapping_interpolate)
{
  const transins::reinserter::CompleteMapping gap0(0);
  const transins::reinserter::CompleteMapping gap1(1);

  const std::string source = "OPEN1 x y z CLOSE1 a";

  // unaligned target token between tagged tokens
  BOOST_CHECK_EQUAL(reinsert(gap0, source, "X N Z A", "0-0 2-2 3-3"),
		    "OPEN1 X CLOSE1 N OPEN1 Z CLOSE1 A");
  BOOST_CHECK_EQUAL(reinsert(gap1, source, "X N Z A", "0-0 2-2 3-3"),
		    "OPEN1 X CLOSE1 OPEN1 N CLOSE1 OPEN1 Z CLOSE1 A");

  // aligned, but to a source token without tags
  BOOST_CHECK_EQUAL(reinsert(gap1, source, "X Y Z A", "0-0 3-1 2-2 3-3"),
		    "OPEN1 X CLOSE1 OPEN1 Y CLOSE1 OPEN1 Z CLOSE1 A");

  // gap wider than the maximum
  BOOST_CHECK_EQUAL(reinsert(gap1, source, "X N N Z A", "0-0 2-3 3-4"),
		    "OPEN1 X CLOSE1 N N OPEN1 Z CLOSE1 A");

  BOOST_CHECK_EQUAL(gap1.max_gap_size(), 1);
}

BOOST_AUTO_TEST_CASE(complete_mapping_neighbors)
{
  transins::TagIndex index(2);
  index[0] = tokens("ISO1 OPEN1 CLOSE1");
  index[1] = tokens("OPEN1 CLOSE1 OPEN2 CLOSE2");

  transins::Alignment::index_set_type sources;
  sources.push_back(0);
  sources.push_back(1);

  transins::reinserter::CompleteMapping::neighbor_type neighbor;

  // isolated tags are ignored without bookkeeping
  neighbor = transins::reinserter::CompleteMapping::neighbors(sources, index, 0);
  BOOST_CHECK_EQUAL(names(neighbor.before), "OPEN1 OPEN2");
  BOOST_CHECK_EQUAL(names(neighbor.after), "CLOSE1 CLOSE2");

  transins::reinserter::CompleteMapping::used_set_type used;
  neighbor = transins::reinserter::CompleteMapping::neighbors(sources, index, &used);
  BOOST_CHECK_EQUAL(names(neighbor.before), "ISO1 OPEN1 OPEN2");

  neighbor = transins::reinserter::CompleteMapping::neighbors(sources, index, &used);
  BOOST_CHECK_EQUAL(names(neighbor.before), "OPEN1 OPEN2");

  transins::reinserter::CompleteMapping::neighbor_type other;
  other.before = tokens("OPEN2");
  other.after  = tokens("CLOSE2 CLOSE3");

  neighbor.intersect(other);
  BOOST_CHECK_EQUAL(names(neighbor.before), "OPEN2");
  BOOST_CHECK_EQUAL(names(neighbor.after), "CLOSE2");
  BOOST_CHECK(! neighbor.empty());

  neighbor.intersect(transins::reinserter::CompleteMapping::neighbor_type());
  BOOST_CHECK(neighbor.empty());
}

BOOST_AUTO_TEST_CASE(move_to_pointed)
{
  const transins::TagMap tag_map = transins::test::tag_map();

  transins::Alignment::index_set_type pointed;
  pointed.push_back(1);
  pointed.push_back(2);

  transins::TagIndex index(5);
  index[0] = tokens("OPEN1 OPEN2 CLOSE2");
  index[3] = tokens("CLOSE1");

  transins::tokens_type unused;
  transins::reinserter::move_to_pointed(index, tag_map, pointed, unused);

  BOOST_CHECK_EQUAL(names(unused), "OPEN2 CLOSE2");
  BOOST_CHECK_EQUAL(names(index[0]), "");
  BOOST_CHECK_EQUAL(names(index[1]), "OPEN1");
  BOOST_CHECK_EQUAL(names(index[2]), "CLOSE1");
  BOOST_CHECK_EQUAL(names(index[3]), "");

  // only isolated tags move
  transins::TagIndex isolated(3);
  isolated[0] = tokens("ISO1 OPEN1");
  isolated[2] = tokens("CLOSE1");

  transins::reinserter::move_isolated_to_pointed(isolated, pointed, unused);

  BOOST_CHECK_EQUAL(names(unused), "");
  BOOST_CHECK_EQUAL(names(isolated[0]), "OPEN1");
  BOOST_CHECK_EQUAL(names(isolated[1]), "ISO1");
  BOOST_CHECK_EQUAL(names(isolated[2]), "CLOSE1");
}

BOOST_AUTO_TEST_CASE(move_to_pointed_shifted)
{
  // the hidden first row is the only one pointing to source token 1
  transins::ProbabilisticAlignment alignment("\
0.0,0.9,0.0 \
0.9,0.0,0.0 \
0.0,0.0,0.9");
  alignment.shift_target(-1);

  transins::TagIndex index(3);
  index[1] = tokens("ISO1");

  transins::tokens_type unused;
  transins::reinserter::move_isolated_to_pointed(index, alignment.pointed(), unused);

  BOOST_CHECK_EQUAL(names(unused), "");
  BOOST_CHECK_EQUAL(names(index[1]), "");
  BOOST_CHECK_EQUAL(names(index[2]), "ISO1");
}
