/***
 * Name: shdoc::support::TrimLeading / TrimTrailing / Trim
 * Purpose: Remove ASCII whitespace from either end of a string_view.
 * Inputs: text
 * Outputs: sub-view of text
 */
#include "shdoc/support/text.h"

#include <cctype>
#include <cstddef>
#include <string_view>

namespace shdoc {
namespace support {

static bool IsSpace(char chr) { return std::isspace(static_cast<unsigned char>(chr)) != 0; }

std::string_view TrimLeading(std::string_view text) {
  std::size_t index = 0;
  while (index < text.size() && IsSpace(text[index])) {
    ++index;
  }
  text.remove_prefix(index);
  return text;
}

std::string_view TrimTrailing(std::string_view text) {
  std::size_t end = text.size();
  while (end > 0 && IsSpace(text[end - 1])) {
    --end;
  }
  return text.substr(0, end);
}

std::string_view Trim(std::string_view text) { return TrimTrailing(TrimLeading(text)); }

}  // namespace support
}  // namespace shdoc
