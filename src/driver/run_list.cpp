/***
 * Name: shdoc::driver::RunList
 * Purpose: Print the full names of the script's functions, one per line.
 * Inputs: ctx (--file, --prefix), args (unused)
 * Outputs: 0
 */
#include "shdoc/driver/app.h"
#include "shdoc/driver/commands.h"

#include <string>
#include <vector>

namespace shdoc::driver {

auto RunList(CommandContext& ctx, const std::vector<std::string>& /*args*/) -> int {
  scan::FilterCriterion filter;
  filter.prefix = ctx.opts.prefix;
  (void)ScanScript(ctx, ScanMode::List, filter);
  return 0;
}

}  // namespace shdoc::driver
