/***
 * Name: archlink::exceptions::ArchlinkException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "archlink/exceptions/archlink_exception.h"

namespace archlink::exceptions {

const char* ArchlinkException::what() const noexcept { return message_.c_str(); }

}  // namespace archlink::exceptions
