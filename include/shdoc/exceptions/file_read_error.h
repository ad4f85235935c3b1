/***
 * Name: shdoc::exceptions::FileReadError
 * Purpose: Exception for unreadable script sources.
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

class FileReadError : public ShdocException {
 public:
  explicit FileReadError(std::string msg) noexcept : ShdocException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace shdoc
