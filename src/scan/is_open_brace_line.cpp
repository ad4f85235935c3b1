/***
 * Name: shdoc::scan::IsOpenBraceLine / EndsWithOpenBrace
 * Purpose: Locate the opening brace of a function body.
 */
#include "shdoc/scan/line_kind.h"
#include "shdoc/support/text.h"

namespace shdoc::scan {

bool IsOpenBraceLine(std::string_view line) { return support::Trim(line) == "{"; }

bool EndsWithOpenBrace(std::string_view line) {
  const std::string_view trimmed = support::TrimTrailing(line);
  return !trimmed.empty() && trimmed.back() == '{';
}

} // namespace shdoc::scan
