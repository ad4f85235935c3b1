/***
 * Name: test_parseargs_sad
 * Purpose: Rejected options report ConfigError with a useful message.
 */
#include <gtest/gtest.h>
#include <string>
#include "shdoc/cli/options.h"
#include "shdoc/cli/parse_args.h"
#include "shdoc/exceptions/config_error.h"

using namespace shdoc::cli;
using shdoc::exceptions::ConfigError;

static std::string parseError(int argc, const char** argv) {
  Options o;
  try {
    ParseArgs(argc, const_cast<char**>(argv), o);
  } catch (const ConfigError& ex) {
    return ex.what();
  }
  return {};
}

TEST(ParseArgsSad, UnknownLongOption) {
  const char* argv[] = {"shdoc", "--unknown", "list"};
  EXPECT_EQ(parseError(3, argv), "unknown option '--unknown'");
}

TEST(ParseArgsSad, KeyMustNotExecute) {
  const char* argv[] = {"shdoc", "--x;rm=1"};
  EXPECT_EQ(parseError(2, argv), "invalid argument format: --x;rm=1");
}

TEST(ParseArgsSad, UnknownShortOption) {
  const char* argv[] = {"shdoc", "-x"};
  EXPECT_EQ(parseError(2, argv), "unknown option '-x'");
}

TEST(ParseArgsSad, StringOptionNeedsValue) {
  const char* argv[] = {"shdoc", "--file"};
  EXPECT_EQ(parseError(2, argv), "option '--file' requires a value");
}

TEST(ParseArgsSad, BadBooleanValue) {
  const char* argv[] = {"shdoc", "--verbose=maybe"};
  EXPECT_EQ(parseError(2, argv), "invalid value 'maybe' for option '--verbose' (expected true or false)");
}

TEST(ParseArgsSad, ThrowsConfigError) {
  const char* argv[] = {"shdoc", "--metrics=2"};
  Options o;
  EXPECT_THROW(ParseArgs(2, const_cast<char**>(argv), o), ConfigError);
}
