/***
 * Name: shdoc::driver::RequireReadableScript
 * Purpose: Fail fast on a missing or unreadable --file.
 * Inputs: opts
 * Outputs: opts.file
 */
#include "shdoc/driver/app.h"
#include "shdoc/exceptions/config_error.h"
#include "shdoc/exceptions/file_read_error.h"
#include "shdoc/support/predicates.h"

#include <string>

namespace shdoc::driver {

auto RequireReadableScript(const cli::Options& opts) -> const std::string& {
  if (support::IsEmpty(opts.file)) {
    throw exceptions::ConfigError("no script given (use --file=<script>)");
  }
  if (!support::FileExists(opts.file)) {
    throw exceptions::FileReadError("no such file: " + opts.file);
  }
  if (!support::IsReadableFile(opts.file)) {
    throw exceptions::FileReadError("cannot read script: " + opts.file);
  }
  return opts.file;
}

}  // namespace shdoc::driver
