#include "shdoc/cli/parse_args_internals.h"

#include <algorithm>

namespace shdoc::cli::detail {
    /***
     * Name: shdoc::cli::detail::isKnownOptionKey
     * Purpose: Restrict option keys to the fixed allow-list.
     */
    bool isKnownOptionKey(const std::string_view key) {
        return std::find(kKnownOptionKeys.begin(), kKnownOptionKeys.end(), key) != kKnownOptionKeys.end();
    }
} // namespace shdoc::cli::detail
