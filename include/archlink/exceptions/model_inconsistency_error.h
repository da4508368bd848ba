/***
 * Name: archlink::exceptions::ModelInconsistencyError
 * Purpose: The class model is internally inconsistent; fatal for the whole run.
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

class ModelInconsistencyError : public ArchlinkException {
 public:
  explicit ModelInconsistencyError(std::string msg) noexcept : ArchlinkException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace archlink
