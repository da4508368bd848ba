/***
 * Name: archlink::io::ScanDump
 * Purpose: Read the line-oriented text form of scanner output.
 * Inputs:
 *   - Dump text and the file name used in handles and error messages
 * Outputs:
 *   - ClassInfo facts (with their members) and raw access records
 * Theory of Operation:
 *   One directive per line; '#' starts a comment. Member lines attach to the
 *   most recent class line. Type names may be internal ("a/b/C") or dotted.
 *
 *     class <name> [extends <super>] [implements <i>,<i>] [modifiers <m>,<m>]
 *       field <name> <descriptor> [<m>,<m>,@<annotation>]
 *       method <name> <descriptor> [...]
 *       constructor <descriptor> [...]
 *       initializer
 *     access get|set|call|new <callerClass> <callerName> <callerDesc> <owner> <name> <desc> <line>
 *
 *   Member descriptors are validated here; access target descriptors are not,
 *   so a malformed reference reaches resolution and is dropped with a warning.
 *   Any syntax error raises DumpParseError naming file and line.
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "archlink/access/RawAccessRecord.h"
#include "archlink/model/ClassDescriptor.h"

namespace archlink::io {

struct ScanDump {
    std::vector<model::ClassInfo> classes;
    std::vector<access::RawAccessRecord> accesses;
};

ScanDump parseScanDump(std::string_view text, const std::string &fileName);

} // namespace archlink::io
