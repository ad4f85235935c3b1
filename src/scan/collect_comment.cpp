/***
 * Name: shdoc::scan::CollectComment
 * Purpose: Fold one raw comment line into the block being accumulated.
 * Inputs:
 *   - block: text collected so far (may be empty)
 *   - commentLine: raw line including its '#'
 * Outputs: updated block; unchanged for blank or decorative lines
 */
#include "shdoc/scan/comment_block.h"
#include "shdoc/support/predicates.h"

#include <string>

namespace shdoc::scan {

std::string CollectComment(const std::string& block, std::string_view commentLine) {
  const std::string_view fragment = StripCommentMarker(commentLine);
  if (support::IsEmptyOrWhitespace(fragment) || IsDecorativeSeparator(fragment)) {
    return block;
  }
  if (support::IsEmpty(block)) {
    return std::string(fragment);
  }
  return AppendComment(block, fragment);
}

} // namespace shdoc::scan
