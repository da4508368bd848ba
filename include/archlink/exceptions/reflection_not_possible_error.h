/***
 * Name: archlink::exceptions::ReflectionNotPossibleError
 * Purpose: An operation needing a real declaration was invoked on a descriptor-only member.
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

class ReflectionNotPossibleError : public ArchlinkException {
 public:
  explicit ReflectionNotPossibleError(std::string msg) noexcept : ArchlinkException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace archlink
