/***
 * Name: archlink::exceptions::MissingDependencyError
 * Purpose: A class or its binary representation needed for completion or resolution cannot be loaded.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from ArchlinkException.
 */
#pragma once

#include <string>
#include <utility>

#include "archlink/exceptions/archlink_exception.h"

namespace archlink {
namespace exceptions {

class MissingDependencyError : public ArchlinkException {
 public:
  explicit MissingDependencyError(std::string msg) noexcept : ArchlinkException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace archlink
