/***
 * Name: shdoc::exceptions::CommandError
 * Purpose: Exception for command names the dispatcher does not know.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from ShdocException; the public
 *   constructor forwards to the protected base constructor.
 */
#pragma once

#include <string>
#include <utility>

#include "shdoc/exceptions/shdoc_exception.h"

namespace shdoc {
namespace exceptions {

class CommandError : public ShdocException {
 public:
  explicit CommandError(std::string msg) noexcept : ShdocException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace shdoc
