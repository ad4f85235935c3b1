/***
 * Name: shdoc::scan::ExtractFuncName
 * Purpose: Resolve the function name from a header line.
 * Inputs: Header line (inline or bare form)
 * Outputs: Bare function name, or an empty string when no form matches
 * Theory of Operation: Forms are tried in order on the leading-trimmed line:
 *   1. `function <name>(...)`  -> token after the keyword, cut at '(' or '{'
 *   2. `function <name>`       -> token after the keyword
 *   3. `<name>()`              -> first token, cut at '(' or '{'
 *   The keyword forms win, so `function f() {` never resolves to "function".
 */
#pragma once

#include <string>
#include <string_view>

namespace shdoc::scan {

std::string ExtractFuncName(std::string_view headerLine);

} // namespace shdoc::scan
