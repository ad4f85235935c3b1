/***
 * Name: shdoc::scan::ExtractAllComments
 * Purpose: Produce help text for every documented function in a source.
 * Inputs:
 *   - source: script lines
 *   - filter: exact target and/or name prefix
 *   - out: destination for formatted entries
 *   - observer: optional per-line hook (scan logs)
 * Outputs: ExtractResult with scan statistics and emitted/suppressed counts
 * Theory of Operation: Records stream straight from the Scanner sink into
 *   ApplyFilter and FormatRecord; nothing is buffered across the file.
 */
#include "shdoc/scan/extract.h"

#include <optional>
#include <string>

namespace shdoc::scan {

ExtractResult ExtractAllComments(input::InputSource& source, const FilterCriterion& filter,
                                 std::ostream& out, const LineObserver& observer) {
  ExtractResult result;
  Scanner scanner([&](const FunctionRecord& record) {
    const std::optional<std::string> display = ApplyFilter(record, filter);
    if (!display) {
      ++result.suppressed;
      return;
    }
    FormatRecord(out, *display, record.comment);
    ++result.emitted;
  });
  result.scan = ScanSource(source, scanner, observer);
  return result;
}

} // namespace shdoc::scan
