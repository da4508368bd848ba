#include "archlink/cli/ParseArgsInternals.h"
#include "archlink/exceptions/config_error.h"

namespace archlink::cli::detail {

/***
 * Name: archlink::cli::detail::parseColorValue
 * Purpose: Parse --color value into ColorMode.
 */
ColorMode parseColorValue(std::string_view value) {
    using enum archlink::cli::ColorMode;
    if (value == "always") { return Always; }
    if (value == "never") { return Never; }
    if (value == "auto") { return Auto; }
    throw exceptions::ConfigError("invalid --color value '" + std::string(value) + "' (expected always|never|auto)");
}

} // namespace archlink::cli::detail
