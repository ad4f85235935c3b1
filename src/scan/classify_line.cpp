/***
 * Name: shdoc::scan::ClassifyLine
 * Purpose: Map a line to its LineKind.
 * Inputs: line
 * Outputs: LineKind
 * Theory of Operation: Checks run in priority order; a commented-out header
 *   such as "# foo() {" is a comment, never a header.
 */
#include "shdoc/scan/line_kind.h"

namespace shdoc::scan {

LineKind ClassifyLine(std::string_view line) {
  if (IsCommentLine(line)) { return LineKind::Comment; }
  if (IsFuncStartLine(line)) {
    return OpensBodyInline(line) ? LineKind::InlineFunctionStart : LineKind::BareFunctionStart;
  }
  if (IsOpenBraceLine(line)) { return LineKind::OpenBrace; }
  return LineKind::Other;
}

} // namespace shdoc::scan
