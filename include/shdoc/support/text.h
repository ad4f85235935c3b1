/***
 * Name: shdoc::support (text)
 * Purpose: Whitespace helpers shared by the line classifier and header resolver.
 * Inputs: string views over a single source line
 * Outputs: trimmed views, tokens, or compacted copies
 * Theory of Operation: ASCII whitespace per std::isspace; views never outlive
 *   the line they were taken from.
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace shdoc {
namespace support {

/*** TrimLeading: Drop leading whitespace. */
std::string_view TrimLeading(std::string_view text);

/*** TrimTrailing: Drop trailing whitespace. */
std::string_view TrimTrailing(std::string_view text);

/*** Trim: Drop leading and trailing whitespace. */
std::string_view Trim(std::string_view text);

/*** SplitWhitespace: Split into whitespace-delimited tokens (awk-style fields). */
std::vector<std::string_view> SplitWhitespace(std::string_view text);

/*** RemoveWhitespace: Copy of text with every whitespace character removed. */
std::string RemoveWhitespace(std::string_view text);

}  // namespace support
}  // namespace shdoc
