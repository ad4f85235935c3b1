/***
 * Name: shdoc::support integer predicates
 * Purpose: Validate integer spellings and compare integer values.
 * Theory of Operation: Spelling checks look at characters only, so values
 *   wider than long long still validate.
 */
#include "shdoc/support/predicates.h"

#include <cctype>
#include <string_view>

namespace shdoc {
namespace support {

static bool AllDigits(std::string_view str) {
  if (str.empty()) { return false; }
  for (const char chr : str) {
    if (std::isdigit(static_cast<unsigned char>(chr)) == 0) { return false; }
  }
  return true;
}

bool IsInteger(std::string_view str) {
  if (!str.empty() && str.front() == '-') { str.remove_prefix(1); }
  return AllDigits(str);
}

bool IsPositiveInteger(std::string_view str) {
  if (!AllDigits(str)) { return false; }
  return str.find_first_not_of('0') != std::string_view::npos;
}

bool IsBetween(long long value, long long low, long long high) { return value >= low && value <= high; }

bool IsOdd(long long value) { return value % 2 != 0; }

bool IsEven(long long value) { return value % 2 == 0; }

}  // namespace support
}  // namespace shdoc
