/***
 * Name: shdoc::driver::ReportMetricsIfRequested
 * Purpose: Print metrics to the diagnostics stream if enabled by CLI.
 * Inputs:
 *   - opts: CLI options containing metrics flags
 *   - metrics: collected timings and counters
 *   - err: destination (stdout carries the documentation itself)
 * Outputs: None
 * Theory of Operation: --metrics-json prints JSON only; --metrics prints text.
 */
#include "shdoc/driver/app.h"

#include <ostream>

namespace shdoc::driver {

auto ReportMetricsIfRequested(const cli::Options& opts, const obs::Metrics& metrics, std::ostream& err)
    -> void {
  if (opts.metricsJson) {
    err << metrics.summaryJson();
  } else if (opts.metrics) {
    err << metrics.summaryText();
  }
}

}  // namespace shdoc::driver
