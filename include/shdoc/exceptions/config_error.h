/***
 * Name: shdoc::exceptions::ConfigError
 * Purpose: Exception for option syntax, unknown keys, and missing required options.
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

class ConfigError : public ShdocException {
 public:
  explicit ConfigError(std::string msg) noexcept : ShdocException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace shdoc
