/***
 * Name: shdoc::scan::ExtractFuncName
 * Purpose: Extract the bare function name from a header line.
 * Inputs: headerLine
 * Outputs: name, or "" when the line matches no supported form
 * Theory of Operation: Fields are split awk-style. The candidate is cut at its
 *   first '(' or '{' so `name()`, `name(){` and `function name{` all resolve
 *   to `name`, then any remaining whitespace is dropped.
 */
#include "shdoc/scan/header_resolver.h"
#include "shdoc/support/predicates.h"
#include "shdoc/support/text.h"

#include <string>
#include <string_view>
#include <vector>

namespace shdoc::scan {

static std::string_view CutNameToken(std::string_view token) {
  const auto paren = token.find_first_of("({");
  return paren == std::string_view::npos ? token : token.substr(0, paren);
}

std::string ExtractFuncName(std::string_view headerLine) {
  const std::string_view line = support::TrimLeading(headerLine);
  const std::vector<std::string_view> fields = support::SplitWhitespace(line);
  if (fields.empty()) { return {}; }

  std::string_view candidate{};
  if (fields.front() == "function" && fields.size() >= 2) {
    // Forms 1 and 2; only form 1 carries parentheses.
    candidate = CutNameToken(fields[1]);
  } else if (support::ContainsSubstring(line, "()")) {
    candidate = CutNameToken(fields.front());
  }
  return support::RemoveWhitespace(candidate);
}

} // namespace shdoc::scan
