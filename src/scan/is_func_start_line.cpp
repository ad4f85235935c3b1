/***
 * Name: shdoc::scan::IsFuncStartLine
 * Purpose: Detect a line that introduces a function definition.
 * Inputs: line
 * Outputs: true for `function <name>...` or any line containing "()"
 * Theory of Operation: The keyword must be a whole word followed by a
 *   non-blank name. The "()" test is deliberately loose; the scanner only
 *   acts on it once an opening brace confirms the header.
 */
#include "shdoc/scan/line_kind.h"
#include "shdoc/support/predicates.h"
#include "shdoc/support/text.h"

#include <cctype>
#include <string_view>

namespace shdoc::scan {

static constexpr std::string_view kFunctionKeyword{"function"};

static bool StartsWithFunctionKeyword(std::string_view trimmed) {
  if (!support::StartsWith(trimmed, kFunctionKeyword)) { return false; }
  const std::string_view rest = trimmed.substr(kFunctionKeyword.size());
  if (rest.empty() || std::isspace(static_cast<unsigned char>(rest.front())) == 0) { return false; }
  return !support::IsEmptyOrWhitespace(rest);
}

bool IsFuncStartLine(std::string_view line) {
  const std::string_view trimmed = support::TrimLeading(line);
  return StartsWithFunctionKeyword(trimmed) || support::ContainsSubstring(trimmed, "()");
}

} // namespace shdoc::scan
