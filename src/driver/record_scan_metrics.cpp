/***
 * Name: shdoc::driver::RecordScanMetrics
 * Purpose: Publish scan statistics as metrics counters.
 * Inputs: metrics, result
 * Outputs: None
 * Theory of Operation: Counters accumulate so a run scanning twice reports totals.
 */
#include "shdoc/driver/app.h"

namespace shdoc::driver {

auto RecordScanMetrics(obs::Metrics& metrics, const scan::ExtractResult& result) -> void {
  metrics.incCounter("scan.lines", result.scan.lines);
  metrics.incCounter("scan.comment_lines", result.scan.commentLines);
  metrics.incCounter("scan.headers", result.scan.headers);
  metrics.incCounter("scan.functions", result.scan.functions);
  metrics.incCounter("scan.discarded_headers", result.scan.discardedHeaders);
  metrics.incCounter("emit.records", result.emitted);
  metrics.incCounter("emit.suppressed", result.suppressed);
}

}  // namespace shdoc::driver
