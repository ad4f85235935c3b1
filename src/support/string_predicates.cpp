/***
 * Name: shdoc::support string predicates
 * Purpose: Emptiness, equality, and affix checks on strings.
 */
#include "shdoc/support/predicates.h"

#include <cctype>
#include <string_view>

namespace shdoc {
namespace support {

bool IsEmpty(std::string_view str) { return str.empty(); }

bool IsNotEmpty(std::string_view str) { return !str.empty(); }

bool IsEqual(std::string_view lhs, std::string_view rhs) { return lhs == rhs; }

bool IsNotEqual(std::string_view lhs, std::string_view rhs) { return lhs != rhs; }

bool StartsWith(std::string_view str, std::string_view prefix) {
  return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool EndsWith(std::string_view str, std::string_view suffix) {
  return str.size() >= suffix.size() &&
         str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool ContainsSubstring(std::string_view str, std::string_view sub) {
  return str.find(sub) != std::string_view::npos;
}

bool IsEmptyOrWhitespace(std::string_view str) {
  for (const char chr : str) {
    if (std::isspace(static_cast<unsigned char>(chr)) == 0) { return false; }
  }
  return true;
}

}  // namespace support
}  // namespace shdoc
