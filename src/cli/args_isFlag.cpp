/***
 * Name: archlink::cli::detail::isFlag (impl)
 * Purpose: Exact match for archlink's value-less switches (--metrics, --quiet, ...).
 */
#include "archlink/cli/ParseArgsInternals.h"

namespace archlink::cli::detail {
    bool isFlag(const std::string_view arg, const std::string_view flag) {
        return arg == flag;
    }
} // namespace archlink::cli::detail
