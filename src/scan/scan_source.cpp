/***
 * Name: shdoc::scan::ScanSource
 * Purpose: Pump lines from an InputSource through a Scanner.
 * Inputs: source, scanner, optional observer
 * Outputs: the scanner's final statistics
 * Theory of Operation: Handles CRLF input; the last line is processed even
 *   without a terminator because InputSource::getline yields it.
 */
#include "shdoc/scan/extract.h"

#include <cstdint>
#include <string>

namespace shdoc::scan {

ScanStats ScanSource(input::InputSource& source, Scanner& scanner, const LineObserver& observer) {
  std::string line;
  uint64_t lineNo = 0;
  while (source.getline(line)) {
    ++lineNo;
    if (!line.empty() && line.back() == '\r') { line.pop_back(); }
    const LineKind kind = scanner.feed(line);
    if (observer) { observer(lineNo, kind, line); }
  }
  scanner.finish();
  return scanner.stats();
}

} // namespace shdoc::scan
