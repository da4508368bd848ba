#pragma once

#include <optional>
#include <string>
#include <vector>

#include "archlink/cli/ColorMode.h"
#include "archlink/model/CodeUnit.h"

namespace archlink::cli {

    struct Options {
        bool showHelp{false};
        bool metrics{false};          // --metrics
        bool metricsJson{false};      // --metrics-json
        bool quiet{false};            // --quiet
        unsigned jobs{1};             // -j <N> / --jobs=<N>; 0 = one per hardware thread
        std::vector<std::string> inputs{};
        std::vector<std::string> classpath{}; // --classpath=<file>, repeatable
        std::optional<model::CodeUnit> caller{}; // --caller=<Class#name#desc>
        ColorMode color{ColorMode::Auto};
    };

} // namespace archlink::cli
