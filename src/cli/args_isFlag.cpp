#include "shdoc/cli/parse_args_internals.h"

namespace shdoc::cli::detail {
    /***
     * Name: shdoc::cli::detail::isFlag
     * Purpose: Check if an argument exactly matches a flag.
     */
    bool isFlag(const std::string_view arg, const std::string_view flag) {
        return arg == flag;
    }
} // namespace shdoc::cli::detail
