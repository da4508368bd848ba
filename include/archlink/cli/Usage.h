#pragma once

#include <string>

namespace archlink::cli {

    std::string Usage();

} // namespace archlink::cli
