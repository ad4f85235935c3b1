/***
 * Name: shdoc::scan (records and filtering)
 * Purpose: Describe a confirmed function and decide whether/how it is shown.
 * Inputs: FunctionRecord from the scanner, FilterCriterion from configuration
 * Outputs: Display name (or nothing) and formatted help text
 * Theory of Operation: The exact target is compared against the full name;
 *   the prefix then restricts and is stripped for display. The prefix is an
 *   explicit value supplied by the caller for the whole run.
 */
#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace shdoc::scan {

struct FunctionRecord {
  std::string name;     // resolved function name
  std::string comment;  // comment block captured right before the header
};

struct FilterCriterion {
  std::string target{};  // exact function name; empty = all functions
  std::string prefix{};  // required name prefix; stripped for display
};

/*** ApplyFilter: Display name for record, or std::nullopt when suppressed. */
std::optional<std::string> ApplyFilter(const FunctionRecord& record, const FilterCriterion& filter);

/*** FormatRecord: "  name\n" plus "    comment\n\n" when comment is non-empty. */
void FormatRecord(std::ostream& out, std::string_view displayName, std::string_view comment);

} // namespace shdoc::scan
