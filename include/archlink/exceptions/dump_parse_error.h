/***
 * Name: archlink::exceptions::DumpParseError
 * Purpose: A scan dump file could not be parsed.
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

class DumpParseError : public ArchlinkException {
 public:
  explicit DumpParseError(std::string msg) noexcept : ArchlinkException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace archlink
