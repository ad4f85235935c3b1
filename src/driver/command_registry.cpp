/***
 * Name: shdoc::driver::CommandRegistry (impl)
 * Purpose: Register and dispatch named command handlers.
 */
#include "shdoc/driver/commands.h"
#include "shdoc/exceptions/command_error.h"

#include <string>
#include <utility>
#include <vector>

namespace shdoc::driver {

void CommandRegistry::add(std::string name, CommandHandler handler) {
  handlers_[std::move(name)] = std::move(handler);
}

bool CommandRegistry::contains(const std::string& name) const { return handlers_.count(name) != 0; }

std::vector<std::string> CommandRegistry::names() const {
  std::vector<std::string> out;
  out.reserve(handlers_.size());
  for (const auto& entry : handlers_) { out.push_back(entry.first); }
  return out;
}

int CommandRegistry::dispatch(const std::string& name, CommandContext& ctx,
                              const std::vector<std::string>& args) const {
  const auto iter = handlers_.find(name);
  if (iter == handlers_.end()) {
    throw exceptions::CommandError("Command " + name + " is not recognized.");
  }
  return iter->second(ctx, args);
}

}  // namespace shdoc::driver
