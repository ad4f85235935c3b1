/***
 * Name: test_parseargs_internals
 * Purpose: Option splitting and allow-list helpers.
 */
#include <gtest/gtest.h>
#include "shdoc/cli/parse_args_internals.h"
#include "shdoc/exceptions/config_error.h"

using namespace shdoc::cli::detail;

TEST(ParseArgsInternals, SplitOptionArg) {
  auto bare = splitOptionArg("--verbose");
  ASSERT_TRUE(bare.has_value());
  EXPECT_EQ(bare->key, "verbose");
  EXPECT_FALSE(bare->value.has_value());

  auto withValue = splitOptionArg("--file=a=b.sh");
  ASSERT_TRUE(withValue.has_value());
  EXPECT_EQ(withValue->key, "file");
  ASSERT_TRUE(withValue->value.has_value());
  EXPECT_EQ(*withValue->value, "a=b.sh");

  EXPECT_FALSE(splitOptionArg("list").has_value());
  EXPECT_FALSE(splitOptionArg("--").has_value());
  EXPECT_FALSE(splitOptionArg("-h").has_value());
  EXPECT_THROW(splitOptionArg("--bad key"), shdoc::exceptions::ConfigError);
}

TEST(ParseArgsInternals, AllowList) {
  for (const auto key : kKnownOptionKeys) { EXPECT_TRUE(isKnownOptionKey(key)); }
  EXPECT_FALSE(isKnownOptionKey("output"));
  EXPECT_FALSE(isKnownOptionKey(""));
}

TEST(ParseArgsInternals, BoolValues) {
  EXPECT_TRUE(parseBoolValue("verbose", "1"));
  EXPECT_TRUE(parseBoolValue("verbose", "true"));
  EXPECT_TRUE(parseBoolValue("verbose", "yes"));
  EXPECT_FALSE(parseBoolValue("verbose", "0"));
  EXPECT_FALSE(parseBoolValue("verbose", "false"));
  EXPECT_FALSE(parseBoolValue("verbose", "no"));
  EXPECT_THROW(parseBoolValue("verbose", ""), shdoc::exceptions::ConfigError);
}

TEST(ParseArgsInternals, Positionals) {
  shdoc::cli::Options o;
  collectPositional("help", o);
  collectPositional("topic", o);
  EXPECT_EQ(o.command, "help");
  ASSERT_EQ(o.args.size(), 1u);
  EXPECT_EQ(o.args[0], "topic");
  EXPECT_TRUE(isUnknownOptionArg("-q"));
  EXPECT_FALSE(isUnknownOptionArg("q"));
}
