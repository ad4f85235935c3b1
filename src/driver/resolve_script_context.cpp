/***
 * Name: shdoc::driver::ResolveScriptContext
 * Purpose: Derive display and path names for a script.
 * Inputs:
 *   - path: script path, relative or absolute
 * Outputs: ScriptContext
 * Theory of Operation: The directory is made absolute against the current
 *   working directory and normalized lexically; a trailing separator is
 *   dropped so `file` is always `dir + "/" + name`.
 */
#include "shdoc/driver/script_context.h"
#include "shdoc/exceptions/config_error.h"
#include "shdoc/exceptions/file_read_error.h"
#include "shdoc/support/predicates.h"

#include <filesystem>
#include <string>
#include <system_error>

namespace shdoc::driver {

namespace fs = std::filesystem;

auto ResolveScriptContext(const std::string& path) -> ScriptContext {
  if (support::IsEmpty(path)) {
    throw exceptions::ConfigError("no script given (use --file=<script>)");
  }
  const fs::path script{path};
  const fs::path parent = script.has_parent_path() ? script.parent_path() : fs::path{"."};

  std::error_code errCode;
  const fs::path absDir = fs::absolute(parent, errCode);
  if (errCode) {
    throw exceptions::FileReadError("cannot resolve directory of '" + path + "': " + errCode.message());
  }

  ScriptContext ctx;
  ctx.name = script.filename().string();
  ctx.dir = absDir.lexically_normal().string();
  while (ctx.dir.size() > 1 && ctx.dir.back() == '/') { ctx.dir.pop_back(); }
  ctx.file = ctx.dir == "/" ? "/" + ctx.name : ctx.dir + "/" + ctx.name;
  ctx.base = ctx.name;
  if (support::EndsWith(ctx.base, ".sh")) { ctx.base.resize(ctx.base.size() - 3); }
  return ctx;
}

}  // namespace shdoc::driver
