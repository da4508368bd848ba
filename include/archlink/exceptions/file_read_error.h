/***
 * Name: archlink::exceptions::FileReadError
 * Purpose: Exception for filesystem read failures.
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

class FileReadError : public ArchlinkException {
 public:
  explicit FileReadError(std::string msg) noexcept : ArchlinkException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace archlink
