/***
 * Name: archlink::exceptions::DescriptorError
 * Purpose: A JVM type or method descriptor is malformed.
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

class DescriptorError : public ArchlinkException {
 public:
  explicit DescriptorError(std::string msg) noexcept : ArchlinkException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace archlink
