/***
 * Name: shdoc::scan::FormatRecord
 * Purpose: Render one help entry.
 * Inputs: out, displayName, comment
 * Outputs: "  <name>\n", followed by "    <comment>\n\n" when comment is non-empty
 * Theory of Operation: Continuation lines of the comment already carry their
 *   indent from AppendComment, so only the first line is indented here.
 */
#include "shdoc/scan/comment_block.h"
#include "shdoc/scan/record.h"

#include <ostream>
#include <string_view>

namespace shdoc::scan {

void FormatRecord(std::ostream& out, std::string_view displayName, std::string_view comment) {
  out << "  " << displayName << '\n';
  if (!comment.empty()) {
    out << kContinuationIndent << comment << "\n\n";
  }
}

} // namespace shdoc::scan
