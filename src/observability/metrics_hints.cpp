/***
 * Name: shdoc::obs::Metrics::hints
 * Purpose: Derive short remarks about a scan from its counters.
 * Outputs (in this order, each only when it applies):
 *   - no_functions_found: scan.functions is recorded and zero
 *   - unconfirmed_headers_present: a bare header never met its brace
 *   - all_records_filtered: functions were found but none was emitted
 */
#include "shdoc/observability/metrics.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace shdoc::obs {

std::vector<std::string> Metrics::hints() const {
  const auto counter = [this](const std::string& key) -> std::optional<uint64_t> {
    const auto iter = counters_.find(key);
    if (iter == counters_.end()) { return std::nullopt; }
    return iter->second;
  };
  const std::optional<uint64_t> functions = counter("scan.functions");
  const std::optional<uint64_t> discarded = counter("scan.discarded_headers");
  const std::optional<uint64_t> emitted = counter("emit.records");

  std::vector<std::string> out;
  if (functions && *functions == 0) { out.emplace_back("no_functions_found"); }
  if (discarded && *discarded > 0) { out.emplace_back("unconfirmed_headers_present"); }
  if (functions && *functions > 0 && emitted && *emitted == 0) { out.emplace_back("all_records_filtered"); }
  return out;
}

} // namespace shdoc::obs
