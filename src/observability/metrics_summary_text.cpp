/***
 * Name: shdoc::obs::Metrics::summaryText
 * Purpose: Render timings, counters and hints for a human reader.
 * Outputs: "== Metrics ==" followed by one indented line per entry.
 */
#include "shdoc/observability/metrics.h"

#include <iomanip>
#include <ios>
#include <sstream>
#include <string>
#include <vector>

namespace shdoc::obs {

namespace {
constexpr double kUsPerMs = 1000.0;
} // namespace

std::string Metrics::summaryText() const {
  std::ostringstream oss;
  oss << "== Metrics ==\n";
  for (const auto& [stage, micros] : durations_us_) {
    oss << "  " << stage << ": " << std::fixed << std::setprecision(3)
        << static_cast<double>(micros) / kUsPerMs << " ms\n";
  }
  for (const auto* values : {&counters_, &gauges_}) {
    for (const auto& [key, val] : *values) { oss << "  " << key << " = " << val << "\n"; }
  }
  const std::vector<std::string> remarks = hints();
  if (!remarks.empty()) {
    oss << "  hints:";
    for (const auto& remark : remarks) { oss << " " << remark; }
    oss << "\n";
  }
  return oss.str();
}

} // namespace shdoc::obs
