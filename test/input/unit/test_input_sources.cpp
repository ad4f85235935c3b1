/***
 * Name: test_input_sources
 * Purpose: FileInput and StringInput line delivery and failure reporting.
 */
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include "shdoc/exceptions/file_read_error.h"
#include "shdoc/exceptions/shdoc_exception.h"
#include "shdoc/input/file_input.h"
#include "shdoc/input/string_input.h"

namespace fs = std::filesystem;
using namespace shdoc::input;

TEST(InputSources, StringInputYieldsLines) {
  StringInput src("one\ntwo\nthree", "<mem>");
  EXPECT_EQ(src.name(), "<mem>");
  std::string line;
  ASSERT_TRUE(src.getline(line));
  EXPECT_EQ(line, "one");
  ASSERT_TRUE(src.getline(line));
  EXPECT_EQ(line, "two");
  ASSERT_TRUE(src.getline(line));
  EXPECT_EQ(line, "three");
  EXPECT_FALSE(src.getline(line));
  EXPECT_FALSE(src.getline(line));
}

TEST(InputSources, EmptyStringHasNoLines) {
  StringInput src("", "<empty>");
  std::string line;
  EXPECT_FALSE(src.getline(line));
}

TEST(InputSources, FileInputReadsFile) {
  const fs::path path = fs::temp_directory_path() / "shdoc_file_input.sh";
  {
    std::ofstream out(path);
    out << "# doc\nfoo() {\n}\n";
  }
  FileInput src(path.string());
  EXPECT_EQ(src.name(), path.string());
  std::string line;
  int count = 0;
  while (src.getline(line)) { ++count; }
  EXPECT_EQ(count, 3);
  fs::remove(path);
}

TEST(InputSources, FileInputMissingFileThrows) {
  const std::string missing = (fs::temp_directory_path() / "shdoc_does_not_exist.sh").string();
  EXPECT_THROW(FileInput{missing}, shdoc::exceptions::FileReadError);
  try {
    FileInput src(missing);
    FAIL() << "expected FileReadError";
  } catch (const shdoc::exceptions::ShdocException& ex) {
    EXPECT_NE(std::string(ex.what()).find("failed to open file"), std::string::npos);
  }
}
