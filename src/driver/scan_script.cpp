/***
 * Name: shdoc::driver::ScanScript
 * Purpose: Run one scan of the --file script in help or list mode.
 * Inputs:
 *   - ctx: options, output streams, metrics
 *   - mode: Help (formatted entries) or List (names only)
 *   - filter: target and prefix for Help; prefix only for List
 * Outputs: ExtractResult
 * Theory of Operation: Times the Read and Scan stages, feeds the optional
 *   scan log through a LineObserver, then records counters and prints the
 *   --verbose summary line.
 */
#include "shdoc/driver/app.h"
#include "shdoc/input/file_input.h"
#include "shdoc/scan/extract.h"
#include "shdoc/scan/line_kind.h"

#include <cstdint>
#include <fstream>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>

namespace shdoc::driver {

auto ScanScript(CommandContext& ctx, ScanMode mode, const scan::FilterCriterion& filter)
    -> scan::ExtractResult {
  const std::string& path = RequireReadableScript(ctx.opts);

  ctx.metrics.start("Read");
  input::FileInput source(path);
  ctx.metrics.stop("Read");

  const std::unique_ptr<std::ofstream> scanLog = OpenScanLog(ctx.opts, ctx.err);
  scan::LineObserver observer;
  if (scanLog) {
    observer = [&scanLog, &path](uint64_t lineNo, scan::LineKind kind, std::string_view line) {
      *scanLog << path << ":" << lineNo << " " << scan::to_string(kind) << " " << line << "\n";
    };
  }

  ctx.metrics.start("Scan");
  const scan::ExtractResult result = mode == ScanMode::List
                                         ? scan::ListFunctions(source, filter.prefix, ctx.out, observer)
                                         : scan::ExtractAllComments(source, filter, ctx.out, observer);
  ctx.metrics.stop("Scan");

  RecordScanMetrics(ctx.metrics, result);
  if (ctx.opts.verbose) {
    ctx.err << "shdoc: " << path << ": " << result.scan.lines << " lines, " << result.scan.functions
            << " functions, " << result.emitted << " emitted" << '\n';
  }
  return result;
}

}  // namespace shdoc::driver
