/***
 * Name: shdoc::driver::RunUsage
 * Purpose: Print a usage page for the scanned script.
 * Inputs: ctx (--file, --prefix), args (unused)
 * Outputs: 0
 * Theory of Operation: Header lines name the script as it would be invoked,
 *   followed by the help entry of every function under "Commands:".
 */
#include "shdoc/driver/app.h"
#include "shdoc/driver/commands.h"
#include "shdoc/driver/script_context.h"

#include <ostream>
#include <string>
#include <vector>

namespace shdoc::driver {

auto RunUsage(CommandContext& ctx, const std::vector<std::string>& /*args*/) -> int {
  const ScriptContext script = ResolveScriptContext(RequireReadableScript(ctx.opts));
  scan::FilterCriterion filter;
  filter.prefix = ctx.opts.prefix;

  ctx.out << "USAGE:" << '\n'
          << "  " << script.name << " <command> [options] [arguments]" << '\n'
          << '\n'
          << "Commands:" << '\n';
  (void)ScanScript(ctx, ScanMode::Help, filter);
  return 0;
}

}  // namespace shdoc::driver
