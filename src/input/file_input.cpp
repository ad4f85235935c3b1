/***
 * Name: shdoc::input::FileInput (impl)
 * Purpose: Read a script file line by line.
 * Inputs:
 *   - path: filesystem path of the script
 * Outputs: One line per getline() call, without the line terminator
 * Theory of Operation: std::getline also yields a final line that lacks a
 *   terminator. Opening or reading failures throw FileReadError instead of
 *   being reported as end-of-file.
 */
#include "shdoc/input/file_input.h"

#include <fstream>
#include <memory>
#include <string>
#include <utility>

#include "shdoc/exceptions/file_read_error.h"

namespace shdoc::input {

FileInput::FileInput(std::string path) : path_(std::move(path)), in_(nullptr) {
  auto ifs = std::make_unique<std::ifstream>(path_);
  if (!ifs->is_open()) {
    throw exceptions::FileReadError("failed to open file: " + path_);
  }
  in_ = std::move(ifs);
}

bool FileInput::getline(std::string& out) {
  if (!in_) { return false; }
  if (std::getline(*in_, out)) { return true; }
  if (in_->bad()) {
    throw exceptions::FileReadError("failed to read file: " + path_);
  }
  return false;
}

} // namespace shdoc::input
