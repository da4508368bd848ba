/***
 * Name: archlink::diag::Diagnostic
 * Purpose: Carry a warning or error with the class or record it concerns.
 */
#pragma once

#include <ostream>
#include <string>

namespace archlink::diag {

    enum class Severity { Warning, Error };

    struct Diagnostic {
        Severity severity{Severity::Warning};
        std::string message;
        std::string subject; // class name or code unit the diagnostic is about
        int line{-1};
    };

    Diagnostic warning(std::string message, std::string subject, int line = -1);

    // "<subject>:<line>: warning: <message>" with optional ANSI colour.
    void printDiagnostic(std::ostream &out, const Diagnostic &diag, bool color);

    // True when ARCHLINK_COLOR holds 1/true/yes (case-insensitive).
    bool useEnvColor();

} // namespace archlink::diag
