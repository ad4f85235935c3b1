/***
 * Name: test_usage
 * Purpose: Validate Usage() content exposes commands and options.
 */
#include <gtest/gtest.h>
#include "shdoc/cli/usage.h"

using namespace shdoc::cli;

TEST(CLI_Usage, ContainsExpectedEntries) {
  auto u = Usage();
  EXPECT_NE(u.find("shdoc [options] <command> [arguments]"), std::string::npos);
  EXPECT_NE(u.find("help"), std::string::npos);
  EXPECT_NE(u.find("list"), std::string::npos);
  EXPECT_NE(u.find("usage"), std::string::npos);
  EXPECT_NE(u.find("--file=<script>"), std::string::npos);
  EXPECT_NE(u.find("--prefix=<prefix>"), std::string::npos);
  EXPECT_NE(u.find("--metrics-json"), std::string::npos);
  EXPECT_NE(u.find("--log-path=<dir>"), std::string::npos);
  EXPECT_NE(u.find("--log-scan"), std::string::npos);
  EXPECT_NE(u.find("End of options"), std::string::npos);
}
