/***
 * Name: archlink::exceptions::ArchlinkException::ArchlinkException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "archlink/exceptions/archlink_exception.h"

#include <utility>

namespace archlink {
namespace exceptions {

ArchlinkException::ArchlinkException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace archlink
