/***
 * Name: shdoc::support::RemoveWhitespace
 * Purpose: Strip all whitespace characters from a string.
 * Inputs: text
 * Outputs: compacted copy
 */
#include "shdoc/support/text.h"

#include <cctype>
#include <string>
#include <string_view>

namespace shdoc {
namespace support {

std::string RemoveWhitespace(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char chr : text) {
    if (std::isspace(static_cast<unsigned char>(chr)) == 0) { out.push_back(chr); }
  }
  return out;
}

}  // namespace support
}  // namespace shdoc
