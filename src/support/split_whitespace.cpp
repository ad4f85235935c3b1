/***
 * Name: shdoc::support::SplitWhitespace
 * Purpose: Split a line into whitespace-delimited fields.
 * Inputs: text
 * Outputs: vector of views into text, in order; empty for blank input
 * Theory of Operation: Runs of whitespace separate fields; leading and
 *   trailing whitespace produce no empty fields.
 */
#include "shdoc/support/text.h"

#include <cctype>
#include <cstddef>
#include <string_view>
#include <vector>

namespace shdoc {
namespace support {

std::vector<std::string_view> SplitWhitespace(std::string_view text) {
  std::vector<std::string_view> fields;
  std::size_t index = 0;
  while (index < text.size()) {
    while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) != 0) {
      ++index;
    }
    if (index >= text.size()) { break; }
    std::size_t end = index;
    while (end < text.size() && std::isspace(static_cast<unsigned char>(text[end])) == 0) {
      ++end;
    }
    fields.emplace_back(text.substr(index, end - index));
    index = end;
  }
  return fields;
}

}  // namespace support
}  // namespace shdoc
