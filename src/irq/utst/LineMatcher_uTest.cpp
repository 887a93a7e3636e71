/**
 * @file LineMatcher_uTest.cpp
 * @brief Unit tests for irqmon::irq line patterns.
 */

#include "src/irq/inc/LineMatcher.hpp"

#include <gtest/gtest.h>

#include <string_view>

using irqmon::irq::LinePattern;
using irqmon::irq::MatchKind;
using irqmon::irq::matchesAny;
using irqmon::irq::parsePatternList;
using irqmon::irq::PatternList;

namespace {

constexpr std::string_view ETH_LINE = " 95:   10   20   30   0  IR-PCI-MSI eth0";
constexpr std::string_view LOC_LINE = "LOC:  100  200  300 400  Local timer interrupts";

} // namespace

/** @test Substring patterns match anywhere in the raw line. */
TEST(LineMatcherTest, SubstringMatch) {
  const LinePattern P{"eth", MatchKind::SUBSTRING};
  EXPECT_TRUE(P.matches(ETH_LINE));
  EXPECT_FALSE(P.matches(LOC_LINE));
}

/** @test Prefix patterns match the start of the trimmed line only. */
TEST(LineMatcherTest, PrefixMatch) {
  const LinePattern P{"95:", MatchKind::PREFIX};
  EXPECT_TRUE(P.matches(ETH_LINE));
  EXPECT_FALSE(P.matches(" 195: 1 2 3 4 x"));
}

/** @test An empty pattern never matches. */
TEST(LineMatcherTest, EmptyPatternNeverMatches) {
  EXPECT_FALSE((LinePattern{"", MatchKind::SUBSTRING}).matches(ETH_LINE));
  EXPECT_FALSE((LinePattern{"", MatchKind::PREFIX}).matches(ETH_LINE));
}

/** @test "^" selects prefix matching; whitespace and empty fields are dropped. */
TEST(LineMatcherTest, ParseList) {
  const PatternList L = parsePatternList(" eth, ^LOC ,,^");
  ASSERT_EQ(L.size(), 2U);
  EXPECT_EQ(L[0].text, "eth");
  EXPECT_EQ(L[0].kind, MatchKind::SUBSTRING);
  EXPECT_EQ(L[1].text, "LOC");
  EXPECT_EQ(L[1].kind, MatchKind::PREFIX);
}

/** @test matchesAny is true if any pattern matches. */
TEST(LineMatcherTest, MatchesAny) {
  const PatternList L = parsePatternList("nvme,^LOC");
  EXPECT_TRUE(matchesAny(L, LOC_LINE));
  EXPECT_FALSE(matchesAny(L, ETH_LINE));
  EXPECT_FALSE(matchesAny(PatternList{}, ETH_LINE));
}

/** @test MatchKind strings. */
TEST(LineMatcherTest, MatchKindToString) {
  EXPECT_STREQ(irqmon::irq::toString(MatchKind::SUBSTRING), "SUBSTRING");
  EXPECT_STREQ(irqmon::irq::toString(MatchKind::PREFIX), "PREFIX");
}
