#include "shdoc/cli/parse_args.h"
#include "shdoc/cli/parse_args_internals.h"
#include "shdoc/exceptions/config_error.h"

#include <optional>
#include <string>
#include <string_view>

namespace shdoc::cli {
    /***
     * Name: shdoc::cli::ParseArgs
     * Purpose: Parse `--key[=value]` options and positional command arguments.
     */
    void ParseArgs(const int argc, char **argv, Options &out) {
        for (int i = 1; i < argc; ++i) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            const std::string_view arg{argv[i]};
            if (detail::isFlag(arg, "--")) {
                for (int j = i + 1; j < argc; ++j) {
                    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
                    detail::collectPositional(argv[j], out);
                }
                break;
            }
            if (detail::isFlag(arg, "-h")) {
                out.showHelp = true;
                continue;
            }
            if (const std::optional<detail::OptionArg> opt = detail::splitOptionArg(arg)) {
                if (!detail::isKnownOptionKey(opt->key)) {
                    throw exceptions::ConfigError("unknown option '--" + std::string(opt->key) + "'");
                }
                detail::applyOption(*opt, out);
                continue;
            }
            if (detail::isUnknownOptionArg(arg)) {
                throw exceptions::ConfigError("unknown option '" + std::string(arg) + "'");
            }
            detail::collectPositional(arg, out);
        }
    }
} // namespace shdoc::cli
