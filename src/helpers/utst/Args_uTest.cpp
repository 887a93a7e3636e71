/**
 * @file Args_uTest.cpp
 * @brief Unit tests for irqmon::helpers::args.
 */

#include "src/helpers/inc/Args.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

using irqmon::helpers::args::ArgMap;
using irqmon::helpers::args::parseArgs;
using irqmon::helpers::args::ParsedArgs;
using irqmon::helpers::args::Positionals;

namespace {

enum Key : std::uint8_t { K_HELP = 0, K_COUNT = 1, K_TRACK = 2 };

ArgMap makeMap() {
  ArgMap map;
  map[K_HELP] = {"--help", 0, false, "help", "-h"};
  map[K_COUNT] = {"--count", 1, false, "count"};
  map[K_TRACK] = {"--track", 1, false, "track"};
  return map;
}

} // namespace

class ArgsTest : public ::testing::Test {
protected:
  ArgMap map_ = makeMap();
  ParsedArgs pargs_{};
  Positionals pos_{};
  std::string error_{};

  bool parse(std::vector<std::string_view> args) {
    return parseArgs(args, map_, pargs_, pos_, error_);
  }
};

/** @test Flags, values and positionals are separated. */
TEST_F(ArgsTest, FlagsAndPositionals) {
  ASSERT_TRUE(parse({"--count", "3", "5", "--track", "eth,^LOC"}));
  ASSERT_EQ(pargs_.count(K_COUNT), 1U);
  EXPECT_EQ(pargs_[K_COUNT][0], "3");
  EXPECT_EQ(pargs_[K_TRACK][0], "eth,^LOC");
  ASSERT_EQ(pos_.size(), 1U);
  EXPECT_EQ(pos_[0], "5");
}

/** @test Short alias maps to the same key. */
TEST_F(ArgsTest, AliasMatches) {
  ASSERT_TRUE(parse({"-h"}));
  EXPECT_EQ(pargs_.count(K_HELP), 1U);
}

/** @test Unknown dash-prefixed tokens are rejected. */
TEST_F(ArgsTest, UnknownOptionRejected) {
  EXPECT_FALSE(parse({"--bogus"}));
  EXPECT_NE(error_.find("--bogus"), std::string::npos);
}

/** @test A flag missing its value is rejected. */
TEST_F(ArgsTest, MissingValueRejected) {
  EXPECT_FALSE(parse({"--count"}));
  EXPECT_FALSE(error_.empty());
}

/** @test A lone "-" is a positional, not an option. */
TEST_F(ArgsTest, LoneDashIsPositional) {
  ASSERT_TRUE(parse({"-"}));
  ASSERT_EQ(pos_.size(), 1U);
  EXPECT_EQ(pos_[0], "-");
}
