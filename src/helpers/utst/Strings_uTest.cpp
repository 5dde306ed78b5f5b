/**
 * @file Strings_uTest.cpp
 * @brief Unit tests for rebind::helpers::strings.
 */

#include "src/helpers/inc/Strings.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using rebind::helpers::strings::isAllDigits;
using rebind::helpers::strings::join;
using rebind::helpers::strings::parseInt;
using rebind::helpers::strings::split;
using rebind::helpers::strings::splitLines;
using rebind::helpers::strings::startsWith;
using rebind::helpers::strings::trim;

/* ----------------------------- trim ----------------------------- */

/** @test Leading and trailing whitespace is removed. */
TEST(StringsTest, TrimStripsWhitespace) {
  EXPECT_EQ(trim("  nvidia \n"), "nvidia");
  EXPECT_EQ(trim("\t\t"), "");
  EXPECT_EQ(trim(""), "");
}

/* ----------------------------- split ----------------------------- */

/** @test Tokens are trimmed and empty tokens dropped. */
TEST(StringsTest, SplitTrimsAndDropsEmpty) {
  const std::vector<std::string> OUT = split("nvidia_modeset, nvidia_uvm,,", ',');
  ASSERT_EQ(OUT.size(), 2U);
  EXPECT_EQ(OUT[0], "nvidia_modeset");
  EXPECT_EQ(OUT[1], "nvidia_uvm");
}

/** @test Lines are split without the terminator. */
TEST(StringsTest, SplitLines) {
  const std::vector<std::string> OUT = splitLines("a\nb\n");
  ASSERT_EQ(OUT.size(), 2U);
  EXPECT_EQ(OUT[1], "b");
}

/** @test Join is the inverse of split for simple lists. */
TEST(StringsTest, JoinWithSeparator) {
  EXPECT_EQ(join({"gdm", "sddm"}, ", "), "gdm, sddm");
  EXPECT_EQ(join({}, ","), "");
}

/* ----------------------------- predicates ----------------------------- */

TEST(StringsTest, StartsWith) {
  EXPECT_TRUE(startsWith("card0", "card"));
  EXPECT_FALSE(startsWith("car", "card"));
}

TEST(StringsTest, IsAllDigits) {
  EXPECT_TRUE(isAllDigits("1234"));
  EXPECT_FALSE(isAllDigits("12a4"));
  EXPECT_FALSE(isAllDigits(""));
}

/* ----------------------------- parseInt ----------------------------- */

/** @test Valid integers parse; junk and trailing text do not. */
TEST(StringsTest, ParseInt) {
  EXPECT_EQ(parseInt("42").value_or(0), 42);
  EXPECT_EQ(parseInt("-7").value_or(0), -7);
  EXPECT_FALSE(parseInt("").has_value());
  EXPECT_FALSE(parseInt("12ms").has_value());
  EXPECT_FALSE(parseInt("abc").has_value());
}
