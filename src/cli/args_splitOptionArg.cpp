#include "shdoc/cli/parse_args_internals.h"
#include "shdoc/exceptions/config_error.h"

#include <cctype>
#include <string>

namespace shdoc::cli::detail {

static bool isKeyChar(const char chr) {
    return std::isalnum(static_cast<unsigned char>(chr)) != 0 || chr == '-' || chr == '_';
}

/***
 * Name: shdoc::cli::detail::splitOptionArg
 * Purpose: Split `--key` / `--key=value` into key and optional value.
 * Theory of Operation: The key is `[A-Za-z0-9][-_A-Za-z0-9]*`. Text after the
 *   key must be empty or start with '='; anything else is a format error.
 */
std::optional<OptionArg> splitOptionArg(const std::string_view arg) {
    constexpr std::string_view kLongPrefix{"--"};
    if (arg.size() <= kLongPrefix.size() || arg.substr(0, kLongPrefix.size()) != kLongPrefix) {
        return std::nullopt;
    }
    const std::string_view body = arg.substr(kLongPrefix.size());
    if (std::isalnum(static_cast<unsigned char>(body.front())) == 0) { return std::nullopt; }

    std::size_t keyEnd = 1;
    while (keyEnd < body.size() && isKeyChar(body[keyEnd])) { ++keyEnd; }

    OptionArg opt{body.substr(0, keyEnd), std::nullopt};
    if (keyEnd == body.size()) { return opt; }
    if (body[keyEnd] != '=') {
        throw exceptions::ConfigError("invalid argument format: " + std::string(arg));
    }
    opt.value = body.substr(keyEnd + 1);
    return opt;
}

} // namespace shdoc::cli::detail
