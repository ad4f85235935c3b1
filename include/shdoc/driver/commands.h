/***
 * Name: shdoc::driver (commands)
 * Purpose: Name-to-handler dispatch for the shdoc subcommands.
 * Inputs: Parsed options, output streams, metrics sink, positional arguments
 * Outputs: Process status code from the selected handler
 * Theory of Operation: A flat map lookup; the registry holds no state beyond
 *   its handlers and dispatch never falls back to a default command.
 */
#pragma once

#include <functional>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

#include "shdoc/cli/options.h"
#include "shdoc/observability/metrics.h"

namespace shdoc {
namespace driver {

/***
 * Name: shdoc::driver::CommandContext
 * Purpose: Everything a command handler may touch during one run.
 */
struct CommandContext {
  const cli::Options& opts;
  std::ostream& out;
  std::ostream& err;
  obs::Metrics& metrics;
};

using CommandHandler = std::function<int(CommandContext&, const std::vector<std::string>&)>;

class CommandRegistry {
 public:
  void add(std::string name, CommandHandler handler);
  bool contains(const std::string& name) const;
  std::vector<std::string> names() const;

  /*** dispatch: Run `name`; throws exceptions::CommandError when unknown. */
  int dispatch(const std::string& name, CommandContext& ctx, const std::vector<std::string>& args) const;

 private:
  std::map<std::string, CommandHandler> handlers_{};
};

/*** BuiltinCommands: Registry holding help, list, and usage. */
CommandRegistry BuiltinCommands();

/*** RunHelp: Print documented functions; args[0], when given, selects prefix + args[0]. */
int RunHelp(CommandContext& ctx, const std::vector<std::string>& args);

/*** RunList: Print function names carrying the configured prefix. */
int RunList(CommandContext& ctx, const std::vector<std::string>& args);

/*** RunUsage: Print a usage page for the script with its documented functions. */
int RunUsage(CommandContext& ctx, const std::vector<std::string>& args);

}  // namespace driver
}  // namespace shdoc
