#include "archlink/cli/ParseArgsInternals.h"
#include "archlink/exceptions/config_error.h"

namespace archlink::cli::detail {
    /***
     * Name: archlink::cli::detail::handleJobsFlag
     * Purpose: Consume `-j <N>` (or the attached form `-j<N>`).
     */
    bool handleJobsFlag(int &idx, const int argc, char **argv, Options &out) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        const std::string_view arg{argv[idx]};
        if (arg.rfind("-j", 0) != 0) { return false; }
        if (arg.size() > 2) {
            out.jobs = parseJobsValue(arg.substr(2));
            return true;
        }
        if (idx + 1 >= argc) {
            throw exceptions::ConfigError("missing value after '-j'");
        }
        ++idx;
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        out.jobs = parseJobsValue(argv[idx]);
        return true;
    }
} // namespace archlink::cli::detail
