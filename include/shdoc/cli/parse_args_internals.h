/**
 * @file
 * @brief Declarations for shdoc CLI argument parsing helpers.
 */
#pragma once

#include <array>
#include <optional>
#include <string_view>

#include "shdoc/cli/options.h"

namespace shdoc::cli::detail {

/** Every `--key` shdoc accepts; anything else is rejected. */
inline constexpr std::array<std::string_view, 8> kKnownOptionKeys{
    "help", "verbose", "metrics", "metrics-json", "log-scan", "file", "prefix", "log-path"};

/** A `--key` or `--key=value` argument split into its parts. */
struct OptionArg {
    std::string_view key;
    std::optional<std::string_view> value;
};

/** Return true if `arg` exactly matches the `flag`. */
bool isFlag(std::string_view arg, std::string_view flag);

/** Split `--key[=value]`; nullopt when `arg` is not long-option shaped. Throws on a malformed key. */
std::optional<OptionArg> splitOptionArg(std::string_view arg);

/** Membership test against kKnownOptionKeys. */
bool isKnownOptionKey(std::string_view key);

/** Parse a boolean option value (1/true/yes, 0/false/no). Throws on anything else. */
bool parseBoolValue(std::string_view key, std::string_view value);

/** Assign a known option to its typed field in `out`. */
void applyOption(const OptionArg& opt, Options& out);

/** Detect option-like arguments beginning with '-' that aren't supported. */
bool isUnknownOptionArg(std::string_view arg);

/** First positional becomes the command, the rest its arguments. */
void collectPositional(std::string_view arg, Options& out);

} // namespace shdoc::cli::detail
