#include "shdoc/cli/parse_args_internals.h"

namespace shdoc::cli::detail {
    /***
     * Name: shdoc::cli::detail::isUnknownOptionArg
     * Purpose: Detect unsupported option-like arguments that start with '-'.
     */
    bool isUnknownOptionArg(const std::string_view arg) {
        return !arg.empty() && arg[0] == '-';
    }
} // namespace shdoc::cli::detail
