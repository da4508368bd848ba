/***
 * Name: archlink::diag::warning
 * Purpose: Build a warning diagnostic.
 */
#include "archlink/diag/Diagnostic.h"

#include <utility>

namespace archlink::diag {
    Diagnostic warning(std::string message, std::string subject, const int line) {
        Diagnostic diag;
        diag.severity = Severity::Warning;
        diag.message = std::move(message);
        diag.subject = std::move(subject);
        diag.line = line;
        return diag;
    }
} // namespace archlink::diag
