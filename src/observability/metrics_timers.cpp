/***
 * Name: shdoc::obs::Metrics::start / stop
 * Purpose: Measure named stages.
 * Theory of Operation: start() stamps the stage; stop() adds the elapsed
 *   microseconds to the stage total, so a stage timed twice accumulates.
 *   Stopping a stage that was never started is ignored.
 */
#include "shdoc/observability/metrics.h"

#include <chrono>
#include <cstdint>
#include <string>

namespace shdoc::obs {

void Metrics::start(const std::string& name) { active_[name] = Clock::now(); }

void Metrics::stop(const std::string& name) {
  const auto iter = active_.find(name);
  if (iter == active_.end()) { return; }
  const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - iter->second);
  durations_us_[name] += static_cast<uint64_t>(elapsed.count());
  active_.erase(iter);
}

} // namespace shdoc::obs
