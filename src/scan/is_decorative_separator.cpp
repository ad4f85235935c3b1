/***
 * Name: shdoc::scan::IsDecorativeSeparator
 * Purpose: Recognize comment rules such as "-----", "=====" or "#####".
 * Inputs: fragment (comment text with the marker already removed)
 * Outputs: true when the trimmed fragment repeats one of '#', '-', '=' at least twice
 */
#include "shdoc/scan/comment_block.h"
#include "shdoc/support/text.h"

#include <string_view>

namespace shdoc::scan {

static constexpr std::string_view kRuleChars{"#-="};

bool IsDecorativeSeparator(std::string_view fragment) {
  const std::string_view rule = support::Trim(fragment);
  if (rule.size() < 2 || kRuleChars.find(rule.front()) == std::string_view::npos) { return false; }
  return rule.find_first_not_of(rule.front()) == std::string_view::npos;
}

} // namespace shdoc::scan
