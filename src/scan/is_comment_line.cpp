/***
 * Name: shdoc::scan::IsCommentLine
 * Purpose: Detect comment lines, indented or not.
 */
#include "shdoc/scan/line_kind.h"
#include "shdoc/support/text.h"

namespace shdoc::scan {

bool IsCommentLine(std::string_view line) {
  const std::string_view trimmed = support::TrimLeading(line);
  return !trimmed.empty() && trimmed.front() == '#';
}

} // namespace shdoc::scan
