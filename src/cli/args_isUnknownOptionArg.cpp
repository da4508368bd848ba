/***
 * Name: archlink::cli::detail::isUnknownOptionArg (impl)
 * Purpose: Reject dash-prefixed arguments archlink does not know; a lone "-" is a dump path.
 */
#include "archlink/cli/ParseArgsInternals.h"

namespace archlink::cli::detail {
    bool isUnknownOptionArg(const std::string_view arg) {
        return arg.size() > 1 && arg[0] == '-';
    }
} // namespace archlink::cli::detail
