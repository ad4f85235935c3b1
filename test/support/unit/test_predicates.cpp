/***
 * Name: test_predicates
 * Purpose: String, integer, path and file-attribute predicates.
 */
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include "shdoc/support/predicates.h"
#include "shdoc/support/text.h"

namespace fs = std::filesystem;
using namespace shdoc::support;

TEST(Predicates, Strings) {
  EXPECT_TRUE(IsEmpty(""));
  EXPECT_FALSE(IsEmpty(" "));
  EXPECT_TRUE(IsNotEmpty("x"));
  EXPECT_TRUE(IsEqual("a", "a"));
  EXPECT_TRUE(IsNotEqual("a", "b"));
  EXPECT_TRUE(StartsWith("cmd_start", "cmd_"));
  EXPECT_FALSE(StartsWith("cmd", "cmd_"));
  EXPECT_TRUE(EndsWith("run.sh", ".sh"));
  EXPECT_FALSE(EndsWith("sh", ".sh"));
  EXPECT_TRUE(ContainsSubstring("foo() {", "()"));
  EXPECT_TRUE(IsEmptyOrWhitespace(" \t "));
  EXPECT_FALSE(IsEmptyOrWhitespace(" x "));
}

TEST(Predicates, Integers) {
  EXPECT_TRUE(IsInteger("42"));
  EXPECT_TRUE(IsInteger("-7"));
  EXPECT_FALSE(IsInteger("-"));
  EXPECT_FALSE(IsInteger("4.2"));
  EXPECT_FALSE(IsInteger(""));
  EXPECT_TRUE(IsPositiveInteger("10"));
  EXPECT_FALSE(IsPositiveInteger("0"));
  EXPECT_FALSE(IsPositiveInteger("000"));
  EXPECT_FALSE(IsPositiveInteger("-3"));
  EXPECT_TRUE(IsBetween(5, 1, 10));
  EXPECT_TRUE(IsBetween(1, 1, 1));
  EXPECT_FALSE(IsBetween(11, 1, 10));
  EXPECT_TRUE(IsOdd(-3));
  EXPECT_TRUE(IsEven(0));
  EXPECT_FALSE(IsEven(7));
}

TEST(Predicates, Paths) {
  EXPECT_TRUE(IsAbsolutePath("/usr/bin"));
  EXPECT_FALSE(IsAbsolutePath("bin"));
  EXPECT_TRUE(IsRelativePath("./bin"));
  EXPECT_TRUE(IsRelativePath(""));
}

TEST(Predicates, FileAttributes) {
  const fs::path dir = fs::temp_directory_path() / "shdoc_predicates";
  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::create_directories(dir);
  const fs::path empty = dir / "empty.sh";
  const fs::path full = dir / "full.sh";
  { std::ofstream out(empty); }
  { std::ofstream out(full); out << "echo hi\n"; }

  EXPECT_TRUE(FileExists(full.string()));
  EXPECT_FALSE(FileExists((dir / "nope").string()));
  EXPECT_TRUE(IsFile(full.string()));
  EXPECT_FALSE(IsFile(dir.string()));
  EXPECT_TRUE(IsDir(dir.string()));
  EXPECT_TRUE(IsReadableFile(full.string()));
  EXPECT_FALSE(IsReadableFile(dir.string()));
  EXPECT_TRUE(IsWritableDir(dir.string()));
  EXPECT_FALSE(FileNotEmpty(empty.string()));
  EXPECT_TRUE(FileNotEmpty(full.string()));

  fs::permissions(full, fs::perms::owner_exec, fs::perm_options::add);
  EXPECT_TRUE(FileIsExecutable(full.string()));
  EXPECT_FALSE(FileIsExecutable(dir.string()));

  const fs::path link = dir / "link.sh";
  fs::create_symlink(full, link, ec);
  if (!ec) {
    EXPECT_TRUE(IsSymlink(link.string()));
    EXPECT_FALSE(IsSymlink(full.string()));
  }
  fs::remove_all(dir, ec);
}

TEST(Text, TrimAndSplit) {
  EXPECT_EQ(TrimLeading("  a b "), "a b ");
  EXPECT_EQ(TrimTrailing("  a b \t"), "  a b");
  EXPECT_EQ(Trim("\t x \n"), "x");
  const auto fields = SplitWhitespace("  function   foo  () ");
  ASSERT_EQ(fields.size(), 3u);
  EXPECT_EQ(fields[0], "function");
  EXPECT_EQ(fields[1], "foo");
  EXPECT_EQ(fields[2], "()");
  EXPECT_EQ(RemoveWhitespace(" a b\tc "), "abc");
}
