#include "shdoc/cli/parse_args_internals.h"
#include "shdoc/exceptions/config_error.h"

#include <string>

namespace shdoc::cli::detail {

/***
 * Name: shdoc::cli::detail::parseBoolValue
 * Purpose: Parse the value of a boolean option given as `--key=value`.
 */
bool parseBoolValue(const std::string_view key, const std::string_view value) {
    if (value == "1" || value == "true" || value == "yes") { return true; }
    if (value == "0" || value == "false" || value == "no") { return false; }
    throw exceptions::ConfigError("invalid value '" + std::string(value) + "' for option '--" +
                                  std::string(key) + "' (expected true or false)");
}

} // namespace shdoc::cli::detail
