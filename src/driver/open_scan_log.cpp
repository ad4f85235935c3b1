/***
 * Name: shdoc::driver::OpenScanLog
 * Purpose: Open `<log-path>/<timestamp>-scan.log` for the per-line scan log.
 * Inputs:
 *   - opts: --log-scan and --log-path
 *   - err: diagnostics stream
 * Outputs: open stream or nullptr
 * Theory of Operation: Mirrors the log directory handling of the CLI: the
 *   directory is created on demand and any failure disables the log with a
 *   message instead of failing the run.
 */
#include "shdoc/driver/app.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <system_error>

namespace shdoc::driver {

static std::string TimestampPrefix() {
  auto tsNow = std::chrono::system_clock::now();
  const std::time_t tsTime = std::chrono::system_clock::to_time_t(tsNow);
  std::tm tmBuf{};
  localtime_r(&tsTime, &tmBuf);
  std::ostringstream timestampStream;
  timestampStream << std::put_time(&tmBuf, "%Y%m%d-%H%M%S");
  return timestampStream.str() + "-";
}

auto OpenScanLog(const cli::Options& opts, std::ostream& err) -> std::unique_ptr<std::ofstream> {
  if (!opts.logScan) {
    return nullptr;
  }
  const std::string logDir = opts.logPath.empty() ? std::string(".") : opts.logPath;
  std::error_code errCode;
  namespace fs = std::filesystem;
  if (!fs::exists(logDir, errCode)) {
    if (!fs::create_directories(logDir, errCode) && !fs::exists(logDir)) {
      err << "shdoc: failed to create log directory '" << logDir << "': " << errCode.message() << "\n";
      return nullptr;
    }
  }
  const std::string logFile = logDir + "/" + TimestampPrefix() + "scan.log";
  auto stream = std::make_unique<std::ofstream>(logFile);
  if (!stream->is_open()) {
    err << "shdoc: failed to open scan log '" << logFile << "'\n";
    return nullptr;
  }
  return stream;
}

}  // namespace shdoc::driver
