#pragma once

namespace archlink::pipeline {

    struct ResolverOptions {
        unsigned jobs{1};         // resolver worker threads; 0 picks hardware concurrency
        bool logWarnings{false};  // stream warnings to std::cerr while importing
        bool color{false};        // ANSI colour for streamed warnings
    };

} // namespace archlink::pipeline
