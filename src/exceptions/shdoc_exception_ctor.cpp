/***
 * Name: shdoc::exceptions::ShdocException::ShdocException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "shdoc/exceptions/shdoc_exception.h"

#include <utility>

namespace shdoc {
namespace exceptions {

ShdocException::ShdocException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace shdoc
