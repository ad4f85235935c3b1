/***
 * Name: shdoc::scan::ListFunctions
 * Purpose: List declared function names found in a source.
 * Inputs: source, prefix (empty = all), out, observer
 * Outputs: One unstripped name per line for functions carrying prefix
 */
#include "shdoc/scan/extract.h"
#include "shdoc/support/predicates.h"

namespace shdoc::scan {

ExtractResult ListFunctions(input::InputSource& source, std::string_view prefix, std::ostream& out,
                            const LineObserver& observer) {
  ExtractResult result;
  Scanner scanner([&](const FunctionRecord& record) {
    if (!support::StartsWith(record.name, prefix)) {
      ++result.suppressed;
      return;
    }
    out << record.name << '\n';
    ++result.emitted;
  });
  result.scan = ScanSource(source, scanner, observer);
  return result;
}

} // namespace shdoc::scan
