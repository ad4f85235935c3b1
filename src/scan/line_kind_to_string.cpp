/***
 * Name: shdoc::scan::to_string(LineKind)
 * Purpose: Stable lowercase names for scan logs.
 */
#include "shdoc/scan/line_kind.h"

namespace shdoc::scan {

const char* to_string(LineKind kind) {
  switch (kind) {
    case LineKind::Comment: return "comment";
    case LineKind::InlineFunctionStart: return "inline-header";
    case LineKind::BareFunctionStart: return "bare-header";
    case LineKind::OpenBrace: return "open-brace";
    case LineKind::Other: return "other";
  }
  return "unknown";
}

} // namespace shdoc::scan
