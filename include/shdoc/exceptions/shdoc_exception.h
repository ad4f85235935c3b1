/***
 * Name: shdoc::exceptions::ShdocException
 * Purpose: Base class for all shdoc exceptions; do not use built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites,
 *   but all throws in shdoc must use a custom type derived from this base.
 */
#pragma once

#include <exception>
#include <string>

namespace shdoc {
namespace exceptions {

class ShdocException : public std::exception {
 public:
  virtual ~ShdocException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit ShdocException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace shdoc
