/***
 * Name: shdoc::driver::RunHelp
 * Purpose: Print the documentation of every function, or of one command.
 * Inputs:
 *   - ctx: run context (--file, --prefix, streams)
 *   - args: optional command name in args[0]; further arguments are ignored
 * Outputs: 0; an unmatched name prints nothing and still succeeds
 * Theory of Operation: The command name is turned into the full function
 *   name (prefix + name) and matched exactly.
 */
#include "shdoc/driver/app.h"
#include "shdoc/driver/commands.h"
#include "shdoc/scan/record.h"

#include <string>
#include <vector>

namespace shdoc::driver {

auto RunHelp(CommandContext& ctx, const std::vector<std::string>& args) -> int {
  scan::FilterCriterion filter;
  filter.prefix = ctx.opts.prefix;
  if (!args.empty() && !args.front().empty()) {
    filter.target = ctx.opts.prefix + args.front();
  }
  (void)ScanScript(ctx, ScanMode::Help, filter);
  return 0;
}

}  // namespace shdoc::driver
