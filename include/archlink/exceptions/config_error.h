/***
 * Name: archlink::exceptions::ConfigError
 * Purpose: Exception for configuration and option errors.
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

class ConfigError : public ArchlinkException {
 public:
  explicit ConfigError(std::string msg) noexcept : ArchlinkException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace archlink
