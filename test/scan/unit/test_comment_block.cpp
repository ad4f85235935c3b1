/***
 * Name: test_comment_block
 * Purpose: Comment marker stripping, separator detection and block joining.
 */
#include <gtest/gtest.h>
#include <string>
#include "shdoc/scan/comment_block.h"

using namespace shdoc::scan;

TEST(CommentBlock, StripMarkerDropsOneSpace) {
  EXPECT_EQ(StripCommentMarker("# text"), "text");
  EXPECT_EQ(StripCommentMarker("   # text"), "text");
  EXPECT_EQ(StripCommentMarker("#text"), "text");
  EXPECT_EQ(StripCommentMarker("#   indented"), "  indented");
  EXPECT_EQ(StripCommentMarker("#"), "");
}

TEST(CommentBlock, DecorativeSeparators) {
  EXPECT_TRUE(IsDecorativeSeparator("----------------"));
  EXPECT_TRUE(IsDecorativeSeparator("=="));
  EXPECT_TRUE(IsDecorativeSeparator("#####"));
  EXPECT_TRUE(IsDecorativeSeparator("  ----  "));
  EXPECT_FALSE(IsDecorativeSeparator("-"));
  EXPECT_FALSE(IsDecorativeSeparator("-=-="));
  EXPECT_FALSE(IsDecorativeSeparator("***"));
  EXPECT_FALSE(IsDecorativeSeparator("-- note"));
  EXPECT_FALSE(IsDecorativeSeparator(""));
}

TEST(CommentBlock, FirstFragmentStandsAlone) {
  EXPECT_EQ(CollectComment("", "# This is a test"), "This is a test");
}

TEST(CommentBlock, ContinuationLinesAreIndented) {
  std::string block = CollectComment("", "# Greets the user.");
  block = CollectComment(block, "# Args: none.");
  EXPECT_EQ(block, "Greets the user.\n    Args: none.");
  EXPECT_EQ(AppendComment("a", "b"), "a\n    b");
}

TEST(CommentBlock, BlankAndDecorativeLinesLeaveBlockUnchanged) {
  const std::string block{"Keep me"};
  EXPECT_EQ(CollectComment(block, "#"), block);
  EXPECT_EQ(CollectComment(block, "#    "), block);
  EXPECT_EQ(CollectComment(block, "# ----------"), block);
  EXPECT_EQ(CollectComment(block, "# ========"), block);
  EXPECT_EQ(CollectComment(block, "##########"), block);
  EXPECT_EQ(CollectComment("", "# -----"), "");
}

TEST(CommentBlock, NoFragmentCarriesMarkerOrSeparator) {
  std::string block;
  for (const char* line : {"# ====", "# Title", "#", "# ----", "#   detail", "# ####"}) {
    block = CollectComment(block, line);
  }
  EXPECT_EQ(block, "Title\n      detail");
}
