//
//  Copyright(C) 2020 transins developers
//

#include <sstream>

#include "document.hpp"
#include "alignment_table.hpp"
#include "test_tags.hpp"

#include <boost/thread.hpp>
#include <boost/lexical_cast.hpp>

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE document_test

#include <boost/test/unit_test.hpp>

using transins::test::line;

// tags of a tagged line replaced by their names
std::string named(const std::string& tagged)
{
  transins::tokens_type tokens;
  transins::split(tagged, tokens);
  return transins::test::names(tokens);
}

BOOST_AUTO_TEST_CASE(document_reinsert)
{
  transins::Document document;

  BOOST_CHECK_EQUAL(named(document(0, line("OPEN1 x CLOSE1 y"), "a b", "0-0 1-1")), "OPEN1 a CLOSE1 b");
  BOOST_CHECK_EQUAL(named(document(1, "x y", "a b", "0-0 1-1")), "a b");

  // not aligned at all
  BOOST_CHECK_EQUAL(named(document(3, line("OPEN1 x CLOSE1 y"), "a b", "")), "a b OPEN1 CLOSE1");

  BOOST_CHECK_EQUAL(document.size(), 4);
  BOOST_CHECK_EQUAL(named(document.result(0)), "OPEN1 a CLOSE1 b");
  BOOST_CHECK_EQUAL(document.result(2), "");
  BOOST_CHECK_EQUAL(document.result(42), "");

  const transins::Document::statistics_type stats = document.statistics();
  BOOST_CHECK_EQUAL(stats.sentences, 3);
  BOOST_CHECK_EQUAL(stats.tagged, 2);
  BOOST_CHECK_EQUAL(stats.unused, 2);
  BOOST_CHECK_EQUAL(stats.malformed, 0);
  BOOST_CHECK_EQUAL(stats.inconsistent, 0);

  // without id nothing is kept
  BOOST_CHECK_EQUAL(named(document(line("OPEN1 x CLOSE1 y"), "a b", "0-0 1-1")), "OPEN1 a CLOSE1 b");
  BOOST_CHECK_EQUAL(document.size(), 4);
  BOOST_CHECK_EQUAL(document.statistics().sentences, 4);

  document.clear();
  BOOST_CHECK_EQUAL(document.size(), 0);
  BOOST_CHECK_EQUAL(document.statistics().sentences, 0);
}

BOOST_AUTO_TEST_CASE(document_malformed)
{
  transins::Document document;

  BOOST_CHECK_EQUAL(document(0, line("OPEN1 x CLOSE1 y"), "Da@@ s ist", "0-0 1-x"), "Das ist");
  BOOST_CHECK_EQUAL(document(1, line("a CLOSE1 b"), "x y", "0-0 1-1"), "x y");

  // sub-words are merged whatever the failure
  BOOST_CHECK_EQUAL(document(2, line("a CLOSE1 b"), "fo@@ o bar", "0-0 1-1"), "foo bar");

  const transins::Document::statistics_type stats = document.statistics();
  BOOST_CHECK_EQUAL(stats.sentences, 3);
  BOOST_CHECK_EQUAL(stats.malformed, 1);
  BOOST_CHECK_EQUAL(stats.inconsistent, 2);
  BOOST_CHECK_EQUAL(stats.tagged, 0);
}

BOOST_AUTO_TEST_CASE(document_offsets)
{
  transins::Document document(transins::MarkupReinserter::COMPLETE_MAPPING, 0, -1, 0);

  // alignment computed with a leading token missing in the source
  BOOST_CHECK_EQUAL(named(document(0, line("OPEN1 y CLOSE1 z"), "a b", "1-0 2-1")), "OPEN1 a CLOSE1 b");
  BOOST_CHECK_EQUAL(document.statistics().unreachable, 0);

  document(1, "x y", "a b", "0-0 1-1");
  BOOST_CHECK_EQUAL(document.statistics().unreachable, 1);
}

BOOST_AUTO_TEST_CASE(document_alignment_table)
{
  transins::Document document;

  const std::string source = line("OPEN1 x CLOSE1 y");

  document.alignments.insert(source, "a b", "0-0 1-1");

  BOOST_CHECK_EQUAL(named(document(0, source, "a b", "")), "OPEN1 a CLOSE1 b");

  // given alignments take precedence
  BOOST_CHECK_EQUAL(named(document(1, source, "a b", "1-0 0-1")), "a OPEN1 b CLOSE1");

  // other translations are not found
  BOOST_CHECK_EQUAL(named(document(2, source, "a c", "")), "a c OPEN1 CLOSE1");
}

struct Task
{
  Task(transins::Document& __document, const int __first, const int __last)
    : document(__document), first(__first), last(__last) {}

  void operator()()
  {
    for (int id = first; id != last; ++ id)
      document(id, line("OPEN1 x CLOSE1 y"), "a" + boost::lexical_cast<std::string>(id) + " b", "0-0 1-1");
  }

  transins::Document& document;
  int first;
  int last;
};

BOOST_AUTO_TEST_CASE(document_threads)
{
  transins::Document document;

  boost::thread_group workers;
  for (int i = 0; i != 4; ++ i)
    workers.add_thread(new boost::thread(Task(document, i * 25, (i + 1) * 25)));
  workers.join_all();

  BOOST_CHECK_EQUAL(document.size(), 100);
  BOOST_CHECK_EQUAL(document.statistics().sentences, 100);
  BOOST_CHECK_EQUAL(document.statistics().tagged, 100);

  for (int id = 0; id != 100; ++ id)
    BOOST_CHECK_EQUAL(named(document.result(id)), "OPEN1 a" + boost::lexical_cast<std::string>(id) + " CLOSE1 b");
}

BOOST_AUTO_TEST_CASE(document_map)
{
  transins::DocumentMap documents;

  transins::DocumentMap::document_ptr_type document(new transins::Document());

  BOOST_CHECK(documents.insert("doc-1", document));
  BOOST_CHECK(! documents.insert("doc-1", transins::DocumentMap::document_ptr_type(new transins::Document())));
  BOOST_CHECK_EQUAL(documents.size(), 1);

  BOOST_CHECK(documents.find("doc-1") == document);
  BOOST_CHECK(! documents.find("doc-2"));

  BOOST_CHECK(documents.erase("doc-1"));
  BOOST_CHECK(! documents.erase("doc-1"));
  BOOST_CHECK(! documents.find("doc-1"));

  documents.insert("doc-2", document);
  documents.clear();
  BOOST_CHECK_EQUAL(documents.size(), 0);
}

BOOST_AUTO_TEST_CASE(alignment_table_read)
{
  std::istringstream is("\
### annotated alignments\n\
\n\
  This is a test .  \n\
Das ist ein Test .\n\
0-0 1-1 2-2 3-3 4-4\n\
###\n\
Hello\n\
Hallo\n\
0-0\n\
");

  transins::AlignmentTable table;
  table.read(is);

  BOOST_CHECK_EQUAL(table.size(), 2);

  std::string alignment;
  BOOST_CHECK(table.find("This is a test .", "Das ist ein Test .", alignment));
  BOOST_CHECK_EQUAL(alignment, "0-0 1-1 2-2 3-3 4-4");

  BOOST_CHECK(table.find(" Hello ", "Hallo ", alignment));
  BOOST_CHECK_EQUAL(alignment, "0-0");

  alignment = "unchanged";
  BOOST_CHECK(! table.find("Hello", "Servus", alignment));
  BOOST_CHECK_EQUAL(alignment, "unchanged");

  table.clear();
  BOOST_CHECK(table.empty());
}
