#include "archlink/cli/ParseArgsInternals.h"
#include "archlink/exceptions/config_error.h"

#include <string>

namespace archlink::cli::detail {
    /***
     * Name: archlink::cli::detail::applyPrefixedOptions
     * Purpose: Parse and apply --key=value options like jobs/classpath/color/caller.
     */
    bool applyPrefixedOptions(std::string_view arg, Options &out) {
        if (constexpr std::string_view jobsPrefix{"--jobs="}; arg.rfind(jobsPrefix, 0) == 0) {
            out.jobs = parseJobsValue(arg.substr(jobsPrefix.size()));
            return true;
        }

        if (constexpr std::string_view classpathPrefix{"--classpath="}; arg.rfind(classpathPrefix, 0) == 0) {
            const auto path = arg.substr(classpathPrefix.size());
            if (path.empty()) { throw exceptions::ConfigError("--classpath needs a file"); }
            out.classpath.emplace_back(path);
            return true;
        }

        if (constexpr std::string_view colorPrefix{"--color="}; arg.rfind(colorPrefix, 0) == 0) {
            out.color = parseColorValue(arg.substr(colorPrefix.size()));
            return true;
        }

        if (constexpr std::string_view callerPrefix{"--caller="}; arg.rfind(callerPrefix, 0) == 0) {
            out.caller = parseCallerValue(arg.substr(callerPrefix.size()));
            return true;
        }
        return false;
    }
} // namespace archlink::cli::detail
