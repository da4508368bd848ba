/***
 * Name: archlink::driver::LoadDump
 * Purpose: Read a dump from disk and parse it.
 */
#include "archlink/driver/app.h"
#include "archlink/exceptions/file_read_error.h"
#include "archlink/support/fs.h"

namespace archlink::driver {

auto LoadDump(const std::string& path) -> io::ScanDump {
  std::string text;
  std::string err;
  if (!support::ReadFile(path, text, err)) {
    throw exceptions::FileReadError(err);
  }
  return io::parseScanDump(text, path);
}

}  // namespace archlink::driver
