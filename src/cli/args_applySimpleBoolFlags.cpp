#include "archlink/cli/ParseArgsInternals.h"

namespace archlink::cli::detail {
    /***
     * Name: archlink::cli::detail::applySimpleBoolFlags
     * Purpose: Handle flag-only boolean options and set outputs.
     */
    bool applySimpleBoolFlags(std::string_view arg, Options &out) {
        if (isFlag(arg, "-h")) {
            out.showHelp = true;
            return true;
        }
        if (isFlag(arg, "--help")) {
            out.showHelp = true;
            return true;
        }
        if (isFlag(arg, "--metrics")) {
            out.metrics = true;
            return true;
        }
        if (isFlag(arg, "--metrics-json")) {
            out.metricsJson = true;
            return true;
        }
        if (isFlag(arg, "--quiet")) {
            out.quiet = true;
            return true;
        }
        return false;
    }
} // namespace archlink::cli::detail
