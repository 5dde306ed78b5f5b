/**
 * @file Args_uTest.cpp
 * @brief Unit tests for rebind::helpers::args.
 */

#include "src/helpers/inc/Args.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

using rebind::helpers::args::ArgMap;
using rebind::helpers::args::firstValue;
using rebind::helpers::args::parseArgs;
using rebind::helpers::args::ParsedArgs;

namespace {

enum Key : std::uint8_t { HELP = 0, DEVICE = 1, NAME = 2 };

ArgMap testMap() {
  ArgMap map;
  map[HELP] = {"--help", 0, false, "help"};
  map[DEVICE] = {"--device", 1, false, "device"};
  map[NAME] = {"--name", 1, true, "name"};
  return map;
}

} // namespace

/** @test Flags with and without values are collected. */
TEST(ArgsTest, ParsesFlagsAndValues) {
  const std::vector<std::string_view> ARGS = {"--name", "gpu", "--device", "2", "--help"};
  ParsedArgs pargs;
  std::string error;
  ASSERT_TRUE(parseArgs(ARGS, testMap(), pargs, error)) << error;
  EXPECT_EQ(pargs.count(HELP), 1U);
  ASSERT_TRUE(firstValue(pargs, DEVICE).has_value());
  EXPECT_EQ(*firstValue(pargs, DEVICE), "2");
  EXPECT_EQ(*firstValue(pargs, NAME), "gpu");
}

/** @test A mistyped flag is an error, not silently ignored. */
TEST(ArgsTest, RejectsUnknownFlag) {
  const std::vector<std::string_view> ARGS = {"--name", "x", "--devcie", "1"};
  ParsedArgs pargs;
  std::string error;
  EXPECT_FALSE(parseArgs(ARGS, testMap(), pargs, error));
  EXPECT_NE(error.find("--devcie"), std::string::npos);
}

/** @test A flag at the end without its value is an error. */
TEST(ArgsTest, MissingValue) {
  const std::vector<std::string_view> ARGS = {"--name", "x", "--device"};
  ParsedArgs pargs;
  std::string error;
  EXPECT_FALSE(parseArgs(ARGS, testMap(), pargs, error));
}

/** @test Required flags must be present. */
TEST(ArgsTest, MissingRequired) {
  const std::vector<std::string_view> ARGS = {"--device", "0"};
  ParsedArgs pargs;
  std::string error;
  EXPECT_FALSE(parseArgs(ARGS, testMap(), pargs, error));
  EXPECT_NE(error.find("--name"), std::string::npos);
}

/** @test firstValue on an absent key is nullopt. */
TEST(ArgsTest, FirstValueAbsent) {
  ParsedArgs pargs;
  EXPECT_FALSE(firstValue(pargs, DEVICE).has_value());
}
