/***
 * Name: shdoc::driver::BuiltinCommands
 * Purpose: Registry with the commands shdoc ships.
 */
#include "shdoc/driver/commands.h"

namespace shdoc::driver {

auto BuiltinCommands() -> CommandRegistry {
  CommandRegistry registry;
  registry.add("help", RunHelp);
  registry.add("list", RunList);
  registry.add("usage", RunUsage);
  return registry;
}

}  // namespace shdoc::driver
