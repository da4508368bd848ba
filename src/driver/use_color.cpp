/***
 * Name: archlink::driver::UseColor
 * Purpose: Resolve --color into a yes/no for stderr output.
 */
#include "archlink/diag/Diagnostic.h"
#include "archlink/driver/app.h"

#include <unistd.h>

namespace archlink::driver {

auto UseColor(const cli::ColorMode mode) -> bool {
  if (mode == cli::ColorMode::Always) {
    return true;
  }
  if (mode == cli::ColorMode::Never) {
    return false;
  }
  constexpr int kStderrFd = 2;
  return (isatty(kStderrFd) != 0) || diag::useEnvColor();
}

}  // namespace archlink::driver
