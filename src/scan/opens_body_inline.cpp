/***
 * Name: shdoc::scan::OpensBodyInline
 * Purpose: Tell inline headers (`f() {`, `f() { :; }`) from bare ones (`f()`).
 * Inputs: line already known to be a function start
 * Outputs: true when the body's opening brace is on this line
 * Theory of Operation: Either the line ends in '{', or the first non-blank
 *   text after the header (keyword and name, then an optional "()") is '{'.
 */
#include "shdoc/scan/line_kind.h"
#include "shdoc/support/predicates.h"
#include "shdoc/support/text.h"

#include <cctype>
#include <cstddef>
#include <string_view>

namespace shdoc::scan {

static std::string_view TextAfterHeader(std::string_view trimmed) {
  constexpr std::string_view kKeyword{"function"};
  if (support::StartsWith(trimmed, kKeyword) && trimmed.size() > kKeyword.size() &&
      std::isspace(static_cast<unsigned char>(trimmed[kKeyword.size()])) != 0) {
    std::string_view rest = support::TrimLeading(trimmed.substr(kKeyword.size()));
    std::size_t nameEnd = 0;
    while (nameEnd < rest.size() && std::isspace(static_cast<unsigned char>(rest[nameEnd])) == 0 &&
           rest[nameEnd] != '(' && rest[nameEnd] != '{') {
      ++nameEnd;
    }
    rest = support::TrimLeading(rest.substr(nameEnd));
    if (support::StartsWith(rest, "()")) { rest = support::TrimLeading(rest.substr(2)); }
    return rest;
  }
  const auto parens = trimmed.find("()");
  if (parens == std::string_view::npos) { return {}; }
  return support::TrimLeading(trimmed.substr(parens + 2));
}

bool OpensBodyInline(std::string_view line) {
  if (EndsWithOpenBrace(line)) { return true; }
  const std::string_view rest = TextAfterHeader(support::TrimLeading(line));
  return !rest.empty() && rest.front() == '{';
}

} // namespace shdoc::scan
