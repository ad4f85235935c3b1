/***
 * Name: shdoc::scan (extraction entry points)
 * Purpose: Run the Scanner over an InputSource and write help text or names.
 * Inputs: InputSource, filter settings, destination stream
 * Outputs: Text on the stream; ExtractResult counters for observability
 * Theory of Operation: One pass in file order. A trailing '\r' is removed
 *   from every line before it reaches the scanner. Read errors propagate as
 *   exceptions::FileReadError from the InputSource.
 */
#pragma once

#include <cstdint>
#include <functional>
#include <ostream>
#include <string_view>

#include "shdoc/input/input_source.h"
#include "shdoc/scan/line_kind.h"
#include "shdoc/scan/record.h"
#include "shdoc/scan/scanner.h"

namespace shdoc::scan {

struct ExtractResult {
  ScanStats scan{};
  uint64_t emitted{0};
  uint64_t suppressed{0};
};

/*** LineObserver: Called once per line with its 1-based number and kind. */
using LineObserver = std::function<void(uint64_t lineNo, LineKind kind, std::string_view line)>;

/*** ScanSource: Feed every line of source to scanner, then finish it. */
ScanStats ScanSource(input::InputSource& source, Scanner& scanner, const LineObserver& observer = {});

/*** ExtractAllComments: Print "name + comment" entries that pass filter. */
ExtractResult ExtractAllComments(input::InputSource& source, const FilterCriterion& filter,
                                 std::ostream& out, const LineObserver& observer = {});

/*** ListFunctions: Print the full name of each function carrying prefix, one per line. */
ExtractResult ListFunctions(input::InputSource& source, std::string_view prefix, std::ostream& out,
                            const LineObserver& observer = {});

} // namespace shdoc::scan
