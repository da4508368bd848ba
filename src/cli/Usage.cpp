#include "archlink/cli/Usage.h"
#include <string>
#include <string_view>
namespace archlink::cli {

namespace {
constexpr std::string_view kUsageText = R"(archlink [options] scan-dump...

Options:
  -h, --help              Print this help and exit
  -j <N>, --jobs=<N>      Resolve with N worker threads (0: one per CPU; default: 1)
  --classpath=<file>      Dump of loadable library classes used for introspection (repeatable)
  --caller=<C#name#desc>  Only print accesses made by this code unit
  --metrics               Print import metrics summary
  --metrics-json          Print import metrics in JSON
  --quiet                 Do not print warnings
  --color=<mode>          Color diagnostics: always|never|auto (default: auto)
  --                      End of options
)";
} // namespace

std::string Usage() { return std::string(kUsageText); }
} // namespace archlink::cli
