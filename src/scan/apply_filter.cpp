/***
 * Name: shdoc::scan::ApplyFilter
 * Purpose: Decide whether a function is shown and under which name.
 * Inputs:
 *   - record: resolved function
 *   - filter: exact target and name prefix (either may be empty)
 * Outputs: display name, or std::nullopt when the record is suppressed
 */
#include "shdoc/scan/record.h"
#include "shdoc/support/predicates.h"

#include <optional>
#include <string>

namespace shdoc::scan {

std::optional<std::string> ApplyFilter(const FunctionRecord& record, const FilterCriterion& filter) {
  if (support::IsNotEmpty(filter.target) && support::IsNotEqual(record.name, filter.target)) {
    return std::nullopt;
  }
  if (support::IsEmpty(filter.prefix)) {
    return record.name;
  }
  if (!support::StartsWith(record.name, filter.prefix)) {
    return std::nullopt;
  }
  return record.name.substr(filter.prefix.size());
}

} // namespace shdoc::scan
