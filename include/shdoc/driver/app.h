/***
 * Name: shdoc::driver (app API)
 * Purpose: Declarations for top-level driver helpers used by main().
 * Inputs: CLI options and output streams
 * Outputs: Status codes, scan results, metrics reports
 * Theory of Operation: Keep main() minimal by factoring helpers into separate
 *   translation units; main only parses options and maps exceptions to
 *   exit statuses.
 */
#pragma once

#include <fstream>
#include <iosfwd>
#include <memory>
#include <string>

#include "shdoc/cli/options.h"
#include "shdoc/driver/commands.h"
#include "shdoc/observability/metrics.h"
#include "shdoc/scan/extract.h"
#include "shdoc/scan/record.h"

namespace shdoc {
namespace driver {

enum class ScanMode { Help, List };

/***
 * Name: shdoc::driver::Run
 * Purpose: Execute one shdoc invocation.
 * Inputs: opts, out (documentation output), err (diagnostics)
 * Outputs: 0 on success; 1 when no command was given
 * Theory of Operation: --help runs the help command with every positional
 *   argument (or prints the tool usage when no --file is set); otherwise the
 *   command is dispatched through BuiltinCommands(). Errors propagate as
 *   ShdocException subclasses.
 */
int Run(const cli::Options& opts, std::ostream& out, std::ostream& err);

/***
 * Name: shdoc::driver::RequireReadableScript
 * Purpose: Validate --file before anything is written.
 * Inputs: opts
 * Outputs: the script path
 * Theory of Operation: Throws ConfigError when --file is missing and
 *   FileReadError when the path is not a readable regular file.
 */
const std::string& RequireReadableScript(const cli::Options& opts);

/***
 * Name: shdoc::driver::ScanScript
 * Purpose: Open the --file script and run one help or list pass over it.
 * Inputs: ctx, mode, filter (the prefix is used alone in List mode)
 * Outputs: ExtractResult; counters recorded into ctx.metrics
 * Theory of Operation: Missing --file raises ConfigError; an unreadable
 *   script raises FileReadError before any output is written.
 */
scan::ExtractResult ScanScript(CommandContext& ctx, ScanMode mode, const scan::FilterCriterion& filter);

/***
 * Name: shdoc::driver::OpenScanLog
 * Purpose: Create the timestamped scan log when --log-scan is set.
 * Inputs: opts, err (for diagnostics)
 * Outputs: open stream, or nullptr when disabled or not creatable
 * Theory of Operation: Creates --log-path if needed; failures are reported
 *   on err and only disable logging.
 */
std::unique_ptr<std::ofstream> OpenScanLog(const cli::Options& opts, std::ostream& err);

/***
 * Name: shdoc::driver::RecordScanMetrics
 * Purpose: Copy scan statistics into the metrics counters.
 */
void RecordScanMetrics(obs::Metrics& metrics, const scan::ExtractResult& result);

/***
 * Name: shdoc::driver::ReportMetricsIfRequested
 * Purpose: Emit metrics in the requested format to err if enabled.
 */
void ReportMetricsIfRequested(const cli::Options& opts, const obs::Metrics& metrics, std::ostream& err);

}  // namespace driver
}  // namespace shdoc
