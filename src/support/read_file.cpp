/***
 * Name: archlink::support::ReadFile
 * Purpose: Read the full contents of a text file into a string.
 * Inputs:
 *   - path: filesystem path to read
 * Outputs:
 *   - out: populated with file contents on success
 *   - err: error message on failure
 * Theory of Operation: Uses std::ifstream with exceptions disabled; checks .good().
 */
#include "archlink/support/fs.h"

#include <fstream>
#include <sstream>
#include <string>

namespace archlink {
namespace support {

bool ReadFile(const std::string& path, std::string& out, std::string& err) {
  const std::ifstream file_stream(path);
  if (!file_stream.good()) {
    err = "failed to open file: " + path;
    return false;
  }
  std::ostringstream stream;
  stream << file_stream.rdbuf();
  if (stream.fail()) {
    err = "failed to read file: " + path;
    return false;
  }
  out = stream.str();
  return true;
}

}  // namespace support
}  // namespace archlink
