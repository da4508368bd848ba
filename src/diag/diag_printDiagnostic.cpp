/***
 * Name: archlink::diag::printDiagnostic
 * Purpose: Render one diagnostic line to a stream.
 * Inputs:
 *   - out: destination stream (std::cerr for live logging)
 *   - diag: diagnostic to render
 *   - color: wrap header and label in ANSI escapes
 * Outputs:
 *   - "<subject>:<line>: warning: <message>\n"
 */
#include "archlink/diag/Diagnostic.h"

#include <string_view>

namespace archlink::diag {
    // ANSI fragments
    static constexpr std::string_view kRed = "\033[31m";
    static constexpr std::string_view kYellow = "\033[33m";
    static constexpr std::string_view kBold = "\033[1m";
    static constexpr std::string_view kReset = "\033[0m";

    static void print_header(std::ostream &out, const Diagnostic &diag, const bool color) {
        if (diag.subject.empty()) { return; }
        if (color) { out << kBold; }
        out << diag.subject;
        if (diag.line > 0) { out << ":" << diag.line; }
        out << ": ";
        if (color) { out << kReset; }
    }

    static void print_label(std::ostream &out, const Severity severity, const bool color) {
        const std::string_view label = severity == Severity::Error ? "error: " : "warning: ";
        if (color) {
            out << (severity == Severity::Error ? kRed : kYellow) << label << kReset;
        } else { out << label; }
    }

    void printDiagnostic(std::ostream &out, const Diagnostic &diag, const bool color) {
        print_header(out, diag, color);
        print_label(out, diag.severity, color);
        out << diag.message << "\n";
    }
} // namespace archlink::diag
