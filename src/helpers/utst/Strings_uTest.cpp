/**
 * @file Strings_uTest.cpp
 * @brief Unit tests for irqmon::helpers::strings.
 */

#include "src/helpers/inc/Strings.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

using irqmon::helpers::strings::isAllDigits;
using irqmon::helpers::strings::splitLines;
using irqmon::helpers::strings::splitList;
using irqmon::helpers::strings::splitWhitespace;
using irqmon::helpers::strings::startsWith;
using irqmon::helpers::strings::trim;

/* ----------------------------- Classification ----------------------------- */

/** @test Digit runs are recognized; empty and mixed tokens are not. */
TEST(StringsTest, IsAllDigits) {
  EXPECT_TRUE(isAllDigits("0"));
  EXPECT_TRUE(isAllDigits("12345"));
  EXPECT_FALSE(isAllDigits(""));
  EXPECT_FALSE(isAllDigits("2-edge"));
  EXPECT_FALSE(isAllDigits("LOC"));
  EXPECT_FALSE(isAllDigits("-1"));
}

/* ----------------------------- Trimming ----------------------------- */

/** @test Surrounding blanks are removed. */
TEST(StringsTest, TrimBothEnds) {
  EXPECT_EQ(trim("  95: 1 2\n"), "95: 1 2");
  EXPECT_EQ(trim("\t\r\n "), "");
  EXPECT_EQ(trim("x"), "x");
}

/* ----------------------------- Splitting ----------------------------- */

/** @test Runs of spaces and tabs separate tokens. */
TEST(StringsTest, SplitWhitespace) {
  const std::vector<std::string_view> TOKS = splitWhitespace("  10\t 20   IR-PCI-MSI  eth0 ");
  ASSERT_EQ(TOKS.size(), 4U);
  EXPECT_EQ(TOKS[0], "10");
  EXPECT_EQ(TOKS[1], "20");
  EXPECT_EQ(TOKS[2], "IR-PCI-MSI");
  EXPECT_EQ(TOKS[3], "eth0");
  EXPECT_TRUE(splitWhitespace("   ").empty());
}

/** @test List fields are trimmed and empty fields dropped. */
TEST(StringsTest, SplitListDropsEmpty) {
  const std::vector<std::string> FIELDS = splitList(" eth , ,^LOC,", ',');
  ASSERT_EQ(FIELDS.size(), 2U);
  EXPECT_EQ(FIELDS[0], "eth");
  EXPECT_EQ(FIELDS[1], "^LOC");
  EXPECT_TRUE(splitList("", ',').empty());
}

/** @test Lines are split on '\n'; a trailing line without newline is kept. */
TEST(StringsTest, SplitLines) {
  const std::vector<std::string_view> LINES = splitLines("a\n\nb\nc");
  ASSERT_EQ(LINES.size(), 4U);
  EXPECT_EQ(LINES[0], "a");
  EXPECT_EQ(LINES[1], "");
  EXPECT_EQ(LINES[3], "c");
  EXPECT_EQ(splitLines("a\n").size(), 1U);
}

/** @test Prefix comparison. */
TEST(StringsTest, StartsWith) {
  EXPECT_TRUE(startsWith("cpu12 1 2", "cpu"));
  EXPECT_TRUE(startsWith("x", ""));
  EXPECT_FALSE(startsWith("cp", "cpu"));
}
