/***
 * Name: shdoc::input::StringInput (impl)
 * Purpose: Serve in-memory text line by line.
 */
#include "shdoc/input/string_input.h"

#include <memory>
#include <sstream>
#include <string>
#include <utility>

namespace shdoc::input {

StringInput::StringInput(std::string text, std::string name)
  : name_(std::move(name)), in_(nullptr) {
  auto iss = std::make_unique<std::istringstream>(std::move(text));
  in_ = std::move(iss);
}

bool StringInput::getline(std::string& out) {
  if (!in_ || !(*in_)) { return false; }
  if (!std::getline(*in_, out)) { return false; }
  return true;
}

} // namespace shdoc::input
