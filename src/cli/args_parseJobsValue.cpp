#include "archlink/cli/ParseArgsInternals.h"
#include "archlink/exceptions/config_error.h"
#include "archlink/support/text.h"

namespace archlink::cli::detail {
    /***
     * Name: archlink::cli::detail::parseJobsValue
     * Purpose: Parse a worker count for -j/--jobs.
     */
    unsigned parseJobsValue(const std::string_view value) {
        int jobs = 0;
        std::string err;
        if (!support::ParseIntStrict(value, jobs, &err)) {
            throw exceptions::ConfigError("invalid job count '" + std::string(value) + "': " + err);
        }
        if (jobs < 0) {
            throw exceptions::ConfigError("job count must not be negative: " + std::string(value));
        }
        return static_cast<unsigned>(jobs);
    }
} // namespace archlink::cli::detail
