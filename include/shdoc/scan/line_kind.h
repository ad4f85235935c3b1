/***
 * Name: shdoc::scan (line classifier)
 * Purpose: Categorize one script line for the comment scanner.
 * Inputs: A single source line without its terminator
 * Outputs: LineKind
 * Theory of Operation: Purely syntactic. Priority order is comment, function
 *   start, lone opening brace, other. A function start is inline when the
 *   line ends in '{' or its body opens right after the header, as in the
 *   one-liner `name() { :; }`.
 */
#pragma once

#include <string_view>

namespace shdoc::scan {

enum class LineKind {
  Comment,              // first non-blank character is '#'
  InlineFunctionStart,  // header whose opening brace is on the same line
  BareFunctionStart,    // header awaiting '{' on the next line
  OpenBrace,            // the line is exactly '{' once trimmed
  Other
};

const char* to_string(LineKind kind);

/*** IsCommentLine: first non-whitespace character is '#'. */
bool IsCommentLine(std::string_view line);

/*** IsFuncStartLine: `function <name>...` or any line containing "()". */
bool IsFuncStartLine(std::string_view line);

/*** EndsWithOpenBrace: last non-whitespace character is '{'. */
bool EndsWithOpenBrace(std::string_view line);

/*** OpensBodyInline: header line that also opens the function body. */
bool OpensBodyInline(std::string_view line);

/*** IsOpenBraceLine: the trimmed line is exactly "{". */
bool IsOpenBraceLine(std::string_view line);

LineKind ClassifyLine(std::string_view line);

} // namespace shdoc::scan
