/***
 * Name: shdoc::scan::AppendComment
 * Purpose: Join a fragment onto an existing block as an indented continuation line.
 */
#include "shdoc/scan/comment_block.h"

#include <string>
#include <string_view>

namespace shdoc::scan {

std::string AppendComment(const std::string& block, std::string_view fragment) {
  std::string out;
  out.reserve(block.size() + 1 + kContinuationIndent.size() + fragment.size());
  out.append(block);
  out.push_back('\n');
  out.append(kContinuationIndent);
  out.append(fragment);
  return out;
}

} // namespace shdoc::scan
