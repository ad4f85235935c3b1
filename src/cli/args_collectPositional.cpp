#include "shdoc/cli/parse_args_internals.h"

#include <string>

namespace shdoc::cli::detail {

/***
 * Name: shdoc::cli::detail::collectPositional
 * Purpose: Route a positional argument to the command or its argument list.
 */
void collectPositional(const std::string_view arg, Options& out) {
    if (out.command.empty() && out.args.empty()) {
        out.command = std::string(arg);
        return;
    }
    out.args.emplace_back(arg);
}

} // namespace shdoc::cli::detail
