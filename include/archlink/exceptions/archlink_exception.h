/***
 * Name: archlink::exceptions::ArchlinkException
 * Purpose: Base class for all archlink exceptions; do not use built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites,
 *   but all throws in archlink must use a custom type derived from this base.
 */
#pragma once

#include <exception>
#include <string>

namespace archlink {
namespace exceptions {

class ArchlinkException : public std::exception {
 public:
  virtual ~ArchlinkException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit ArchlinkException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace archlink
