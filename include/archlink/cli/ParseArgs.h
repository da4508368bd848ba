#pragma once

#include "archlink/cli/Options.h"

namespace archlink::cli {

    // Parse argv into Options. Returns false on fatal parse error.
    bool ParseArgs(int argc, char** argv, Options& out);

} // namespace archlink::cli
