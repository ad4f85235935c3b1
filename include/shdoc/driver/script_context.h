/***
 * Name: shdoc::driver::ScriptContext
 * Purpose: Names derived from the path of the script being documented.
 * Inputs: Script path as given on the command line
 * Outputs: name (last component), dir (absolute directory), file (dir/name),
 *   base (name without a trailing ".sh")
 * Theory of Operation: Lexical resolution against the current directory;
 *   symlinks are not followed and the file need not exist.
 */
#pragma once

#include <string>

namespace shdoc {
namespace driver {

struct ScriptContext {
  std::string name;
  std::string dir;
  std::string file;
  std::string base;
};

/*** ResolveScriptContext: Throws exceptions::ConfigError for an empty path. */
ScriptContext ResolveScriptContext(const std::string& path);

}  // namespace driver
}  // namespace shdoc
