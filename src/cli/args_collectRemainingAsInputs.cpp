/***
 * Name: archlink::cli::detail::collectRemainingAsInputs (impl)
 * Purpose: After "--", every remaining argument is a scan dump path, even one starting with '-'.
 */
#include "archlink/cli/ParseArgsInternals.h"

namespace archlink::cli::detail {

void collectRemainingAsInputs(std::size_t startIndex, int argc, char** argv, Options& out) {
    for (int j = static_cast<int>(startIndex); j < argc; ++j) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        out.inputs.emplace_back(argv[j]);
    }
}

} // namespace archlink::cli::detail
