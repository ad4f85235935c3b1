/***
 * Name: shdoc::scan (comment accumulator)
 * Purpose: Build a documentation block from consecutive comment lines.
 * Inputs: The block collected so far and the next raw comment line
 * Outputs: The updated block
 * Theory of Operation: Each comment line loses its '#' marker and one
 *   following space. Blank fragments and decorative rules ("----", "====",
 *   "####") contribute nothing. The first fragment starts the block; later
 *   fragments go on their own line behind kContinuationIndent.
 */
#pragma once

#include <string>
#include <string_view>

namespace shdoc::scan {

inline constexpr std::string_view kContinuationIndent{"    "};

/*** StripCommentMarker: Remove leading blanks, the '#', and at most one space. */
std::string_view StripCommentMarker(std::string_view line);

/*** IsDecorativeSeparator: two or more of one character among '#', '-', '='. */
bool IsDecorativeSeparator(std::string_view fragment);

/*** AppendComment: block + newline + indent + fragment. */
std::string AppendComment(const std::string& block, std::string_view fragment);

/*** CollectComment: Fold one raw comment line into block. */
std::string CollectComment(const std::string& block, std::string_view commentLine);

} // namespace shdoc::scan
