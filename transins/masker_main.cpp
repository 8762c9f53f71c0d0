//
//  Copyright(C) 2020 transins developers
//

#include "masker.hpp"
#include "test_tags.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE masker_test

#include <boost/test/unit_test.hpp>

using transins::test::tag;

BOOST_AUTO_TEST_CASE(masker_mask)
{
  const transins::Masker masker;

  const std::string OPEN1 = tag("OPEN1");
  const std::string ISO1  = tag("ISO1");

  std::string unmasked;
  std::string masked;

  unmasked = "a b c " + OPEN1 + " x y z";
  masked   = "a b c x" + OPEN1 + "c x y z";
  BOOST_CHECK_EQUAL(masker.mask(transins::test::tokens(unmasked)), masked);
  BOOST_CHECK_EQUAL(masker.unmask(masked), unmasked);

  unmasked = OPEN1 + " x y z";
  masked   = "x" + OPEN1 + " x y z";
  BOOST_CHECK_EQUAL(masker.mask(transins::test::tokens(unmasked)), masked);
  BOOST_CHECK_EQUAL(masker.unmask(masked), unmasked);

  unmasked = "a b c " + OPEN1;
  masked   = "a b c " + OPEN1 + "c";
  BOOST_CHECK_EQUAL(masker.mask(transins::test::tokens(unmasked)), masked);
  BOOST_CHECK_EQUAL(masker.unmask(masked), unmasked);

  unmasked = "a b c " + ISO1 + " " + OPEN1 + " x y z";
  masked   = "a b c x" + ISO1 + "c x" + OPEN1 + "c x y z";
  BOOST_CHECK_EQUAL(masker.mask(transins::test::tokens(unmasked)), masked);
  BOOST_CHECK_EQUAL(masker.unmask(masked), unmasked);

  unmasked = ISO1 + " " + OPEN1 + " x y z";
  masked   = "x" + ISO1 + " x" + OPEN1 + " x y z";
  BOOST_CHECK_EQUAL(masker.mask(transins::test::tokens(unmasked)), masked);
  BOOST_CHECK_EQUAL(masker.unmask(masked), unmasked);

  BOOST_CHECK_EQUAL(masker.mask(transins::test::tokens("a b c")), "a b c");
  BOOST_CHECK_EQUAL(masker.unmask("a b c"), "a b c");
}

BOOST_AUTO_TEST_CASE(masker_mask_multibyte)
{
  const transins::Masker masker;

  const std::string OPEN1 = tag("OPEN1");

  // ornaments are code points, not bytes
  const std::string unmasked = "\xC3\xA4\xC3\xB6 " + OPEN1 + " \xC3\xBC" + "x";
  const std::string masked   = "\xC3\xA4\xC3\xB6 \xC3\xBC" + OPEN1 + "\xC3\xB6 \xC3\xBC" + "x";

  BOOST_CHECK_EQUAL(masker.mask(transins::test::tokens(unmasked)), masked);
  BOOST_CHECK_EQUAL(masker.unmask(masked), unmasked);
}

BOOST_AUTO_TEST_CASE(masker_detokenize)
{
  const transins::Masker masker;

  const std::string OPEN1  = tag("OPEN1");
  const std::string CLOSE1 = tag("CLOSE1");
  const std::string ISO1   = tag("ISO1");

  BOOST_CHECK_EQUAL(masker.detokenize("x y z " + ISO1 + " a " + OPEN1 + " b " + CLOSE1 + " c"),
		    "x y z " + ISO1 + "a " + OPEN1 + "b" + CLOSE1 + " c");

  BOOST_CHECK_EQUAL(masker.detokenize("x y z " + ISO1 + "   a   " + OPEN1 + "  b   " + CLOSE1 + "  c"),
		    "x y z " + ISO1 + "a   " + OPEN1 + "b" + CLOSE1 + "  c");

  BOOST_CHECK_EQUAL(masker.detokenize("x y z " + ISO1 + " a " + OPEN1 + " " + CLOSE1 + " b"),
		    "x y z " + ISO1 + "a " + OPEN1 + CLOSE1 + " b");

  BOOST_CHECK_EQUAL(masker.detokenize("x y z"), "x y z");
}
