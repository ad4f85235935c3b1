/***
 * Name: shdoc::exceptions::ShdocException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "shdoc/exceptions/shdoc_exception.h"

namespace shdoc::exceptions {

const char* ShdocException::what() const noexcept { return message_.c_str(); }

}  // namespace shdoc::exceptions
