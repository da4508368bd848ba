/***
 * Name: archlink::cli::ColorMode
 * Purpose: --color setting for warnings archlink writes to stderr.
 * Theory of Operation: Auto defers to driver::UseColor (terminal or ARCHLINK_COLOR).
 */
#pragma once

namespace archlink::cli {

    enum class ColorMode {
        Auto,
        Always,
        Never
    };

} // namespace archlink::cli
