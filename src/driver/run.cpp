/***
 * Name: shdoc::driver::Run
 * Purpose: Execute one shdoc invocation from parsed options.
 * Inputs:
 *   - opts: parsed CLI options
 *   - out: destination for documentation output
 *   - err: destination for usage text and diagnostics
 * Outputs: POSIX status code
 * Theory of Operation: --help maps to the help command with all positional
 *   arguments; without --file it prints the tool usage instead. A missing
 *   command prints the usage to err and returns 1. Metrics are reported after
 *   the command finishes.
 */
#include "shdoc/cli/usage.h"
#include "shdoc/driver/app.h"
#include "shdoc/driver/commands.h"
#include "shdoc/observability/metrics.h"

#include <ostream>
#include <string>
#include <vector>

namespace shdoc::driver {

auto Run(const cli::Options& opts, std::ostream& out, std::ostream& err) -> int {
  obs::Metrics metrics;
  CommandContext ctx{opts, out, err, metrics};

  int status = 0;
  if (opts.showHelp) {
    if (opts.file.empty()) {
      out << cli::Usage();
      return 0;
    }
    std::vector<std::string> args;
    if (!opts.command.empty()) { args.push_back(opts.command); }
    args.insert(args.end(), opts.args.begin(), opts.args.end());
    status = RunHelp(ctx, args);
  } else if (opts.command.empty()) {
    err << cli::Usage();
    return 1;
  } else {
    status = BuiltinCommands().dispatch(opts.command, ctx, opts.args);
  }

  ReportMetricsIfRequested(opts, metrics, err);
  return status;
}

}  // namespace shdoc::driver
