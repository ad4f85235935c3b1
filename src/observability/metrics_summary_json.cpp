/***
 * Name: shdoc::obs::Metrics::summaryJson
 * Purpose: Render the metrics as a JSON document for tooling.
 * Outputs:
 *   { "durations_ms": {...}, "counters": {...}, "gauges": {...}, "hints": [...] }
 *   durations_ms is always present; the other members only when non-empty.
 * Theory of Operation: Stage keys are lowercased so consumers can rely on
 *   "read" and "scan" regardless of how the driver spells the stage.
 */
#include "shdoc/observability/metrics.h"

#include <cctype>
#include <cstdint>
#include <iomanip>
#include <ios>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace shdoc::obs {

namespace {
constexpr double kUsPerMs = 1000.0;
constexpr std::string_view kMemberPad{"    "};
} // namespace

static std::string lowerKey(std::string_view key) {
  std::string out(key);
  for (auto& chr : out) { chr = static_cast<char>(std::tolower(static_cast<unsigned char>(chr))); }
  return out;
}

// Writes `"name": {` ... `}` with one `"key": value` member per line.
template <typename ValueWriter>
static void writeObject(std::ostringstream& oss, std::string_view name,
                        const std::map<std::string, uint64_t>& values, ValueWriter writeMember) {
  oss << "  \"" << name << "\": {";
  const char* sep = "";
  for (const auto& [key, val] : values) {
    oss << sep << "\n" << kMemberPad;
    writeMember(oss, key, val);
    sep = ",";
  }
  oss << "\n  }";
}

static void writeCount(std::ostringstream& oss, const std::string& key, uint64_t val) {
  oss << "\"" << key << "\": " << val;
}

std::string Metrics::summaryJson() const {
  std::ostringstream oss;
  oss << "{\n";
  writeObject(oss, "durations_ms", durations_us_,
              [](std::ostringstream& os, const std::string& stage, uint64_t micros) {
                os << "\"" << lowerKey(stage) << "\": " << std::fixed << std::setprecision(3)
                   << static_cast<double>(micros) / kUsPerMs;
              });
  if (!counters_.empty()) {
    oss << ",\n";
    writeObject(oss, "counters", counters_, writeCount);
  }
  if (!gauges_.empty()) {
    oss << ",\n";
    writeObject(oss, "gauges", gauges_, writeCount);
  }
  const std::vector<std::string> remarks = hints();
  if (!remarks.empty()) {
    oss << ",\n  \"hints\": [";
    const char* sep = "";
    for (const auto& remark : remarks) {
      oss << sep << "\"" << remark << "\"";
      sep = ", ";
    }
    oss << "]";
  }
  oss << "\n}\n";
  return oss.str();
}

} // namespace shdoc::obs
