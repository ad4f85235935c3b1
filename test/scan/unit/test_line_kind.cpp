/***
 * Name: test_line_kind
 * Purpose: Line classification across comment, header, brace and other lines.
 */
#include <gtest/gtest.h>
#include "shdoc/scan/line_kind.h"

using namespace shdoc::scan;

TEST(LineKind, CommentLines) {
  EXPECT_EQ(ClassifyLine("# hi"), LineKind::Comment);
  EXPECT_EQ(ClassifyLine("   # indented"), LineKind::Comment);
  EXPECT_EQ(ClassifyLine("#"), LineKind::Comment);
  // A comment mentioning a header is still a comment.
  EXPECT_EQ(ClassifyLine("# call foo() first"), LineKind::Comment);
}

TEST(LineKind, InlineHeaders) {
  EXPECT_EQ(ClassifyLine("hello() {"), LineKind::InlineFunctionStart);
  EXPECT_EQ(ClassifyLine("process_file(){"), LineKind::InlineFunctionStart);
  EXPECT_EQ(ClassifyLine("function foo {"), LineKind::InlineFunctionStart);
  EXPECT_EQ(ClassifyLine("function foo() {"), LineKind::InlineFunctionStart);
  EXPECT_EQ(ClassifyLine("  hello() {   "), LineKind::InlineFunctionStart);
}

TEST(LineKind, OneLinerBodyOpensInline) {
  EXPECT_EQ(ClassifyLine("plain() { :; }"), LineKind::InlineFunctionStart);
  EXPECT_EQ(ClassifyLine("function quick { return 0; }"), LineKind::InlineFunctionStart);
}

TEST(LineKind, BareHeaders) {
  EXPECT_EQ(ClassifyLine("function goodbye"), LineKind::BareFunctionStart);
  EXPECT_EQ(ClassifyLine("function goodbye()"), LineKind::BareFunctionStart);
  EXPECT_EQ(ClassifyLine("hello()"), LineKind::BareFunctionStart);
}

TEST(LineKind, KeywordNeedsNameAfterWhitespace) {
  EXPECT_EQ(ClassifyLine("function"), LineKind::Other);
  EXPECT_EQ(ClassifyLine("function   "), LineKind::Other);
  EXPECT_EQ(ClassifyLine("functional_test"), LineKind::Other);
}

TEST(LineKind, BraceAndOther) {
  EXPECT_EQ(ClassifyLine("{"), LineKind::OpenBrace);
  EXPECT_EQ(ClassifyLine("   {  "), LineKind::OpenBrace);
  EXPECT_EQ(ClassifyLine("{ :"), LineKind::Other);
  EXPECT_EQ(ClassifyLine("echo hi"), LineKind::Other);
  EXPECT_EQ(ClassifyLine(""), LineKind::Other);
  EXPECT_EQ(ClassifyLine("}"), LineKind::Other);
}

TEST(LineKind, ToString) {
  EXPECT_STREQ(to_string(LineKind::Comment), "comment");
  EXPECT_STREQ(to_string(LineKind::InlineFunctionStart), "inline-header");
  EXPECT_STREQ(to_string(LineKind::BareFunctionStart), "bare-header");
  EXPECT_STREQ(to_string(LineKind::OpenBrace), "open-brace");
  EXPECT_STREQ(to_string(LineKind::Other), "other");
}
