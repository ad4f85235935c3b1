/***
 * Name: shdoc::scan::StripCommentMarker
 * Purpose: Reduce a raw comment line to its text.
 * Inputs: line (expected to be a comment line)
 * Outputs: view past the '#' and at most one following space
 * Theory of Operation: Further leading blanks are kept so indented
 *   argument lists ("#   $1: path") stay indented in the help text.
 */
#include "shdoc/scan/comment_block.h"
#include "shdoc/support/text.h"

namespace shdoc::scan {

std::string_view StripCommentMarker(std::string_view line) {
  std::string_view text = support::TrimLeading(line);
  if (!text.empty() && text.front() == '#') { text.remove_prefix(1); }
  if (!text.empty() && text.front() == ' ') { text.remove_prefix(1); }
  return text;
}

} // namespace shdoc::scan
