#include "archlink/cli/ParseArgs.h"
#include "archlink/cli/ParseArgsInternals.h"
#include "archlink/exceptions/config_error.h"
#include <iostream>

namespace archlink::cli {
    /***
     * Name: archlink::cli::ParseArgs
     * Purpose: Minimal GCC-like CLI argument parser for archlink.
     */
    bool ParseArgs(const int argc, char **argv, Options &out) {
        try {
            for (int i = 1; i < argc; ++i) {
                // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
                const std::string_view arg{argv[i]};
                if (detail::isFlag(arg, "--")) {
                    detail::collectRemainingAsInputs(i + 1, argc, argv, out);
                    break;
                }
                if (detail::handleJobsFlag(i, argc, argv, out)) { continue; }
                if (detail::applySimpleBoolFlags(arg, out)) { continue; }
                if (detail::applyPrefixedOptions(arg, out)) { continue; }

                // Positional
                if (detail::isUnknownOptionArg(arg)) {
                    std::cerr << "archlink: unknown option '" << arg << "'\n";
                    return false;
                }
                out.inputs.emplace_back(std::string(arg));
            }
        } catch (const exceptions::ConfigError &e) {
            std::cerr << "archlink: " << e.what() << "\n";
            return false;
        }
        return true;
    }
} // namespace archlink::cli
