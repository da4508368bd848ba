/***
 * Name: archlink::support (fs)
 * Purpose: File input for scan and classpath dumps.
 * Inputs: Paths and string buffers
 * Outputs: File contents from disk
 * Theory of Operation: Thin wrapper over fstream to centralize error handling.
 */
#pragma once

#include <string>

namespace archlink {
namespace support {

/*** ReadFile: Read entire file into out. Return true on success, otherwise set err. */
bool ReadFile(const std::string& path, std::string& out, std::string& err);

}  // namespace support
}  // namespace archlink
