#include "shdoc/cli/usage.h"
#include <string>
#include <string_view>
namespace shdoc::cli {

namespace {
// Keep help text as a compile-time constant to avoid reallocation work.
constexpr std::string_view kUsageText = R"(shdoc [options] <command> [arguments]

Extract function documentation comments from a shell script.

Commands:
  help [name]          Print every documented function, or only <name>
  list                 Print the names of the functions in the script
  usage                Print a usage page for the script

Options:
  -h, --help           Same as the help command; this text without --file
  --file=<script>      Script to scan (required by every command)
  --prefix=<prefix>    Only functions named <prefix>*; help hides the prefix
  --verbose            Print a one-line scan summary to stderr
  --metrics            Print scan metrics to stderr
  --metrics-json       Print scan metrics to stderr as JSON
  --log-path=<dir>     Directory where scan logs are written (default: .)
  --log-scan           Write a per-line classification log to --log-path
  --                   End of options
)";
} // namespace

std::string Usage() { return std::string(kUsageText); }
} // namespace shdoc::cli
