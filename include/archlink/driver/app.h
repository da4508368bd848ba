/***
 * Name: archlink::driver (app API)
 * Purpose: Declarations for top-level driver helpers used by main().
 * Inputs: CLI options, dump paths, the resolved model
 * Outputs: Loaded dumps, printed accesses and metrics, status codes
 * Theory of Operation: Keep main() minimal by factoring helpers into separate
 *   translation units; one function per .cpp file.
 */
#pragma once

#include <optional>
#include <ostream>
#include <string>

#include "archlink/cli/ColorMode.h"
#include "archlink/cli/Options.h"
#include "archlink/io/ScanDump.h"
#include "archlink/model/CodeUnit.h"
#include "archlink/observability/Metrics.h"
#include "archlink/pipeline/ResolvedModel.h"

namespace archlink {
namespace driver {

/***
 * Name: archlink::driver::LoadDump
 * Purpose: Read and parse one scan dump file.
 * Inputs: path
 * Outputs: ScanDump; throws FileReadError or DumpParseError
 */
io::ScanDump LoadDump(const std::string& path);

/***
 * Name: archlink::driver::UseColor
 * Purpose: Decide whether diagnostics on stderr are coloured.
 * Theory of Operation: always/never are final; auto colours when stderr is a
 *   terminal or ARCHLINK_COLOR asks for it.
 */
bool UseColor(cli::ColorMode mode);

/***
 * Name: archlink::driver::PrintModel
 * Purpose: Print every resolved access, one line each, grouped by caller.
 * Inputs: output stream, model, optional caller restriction
 */
void PrintModel(std::ostream& out, const pipeline::ResolvedModel& resolved,
                const std::optional<model::CodeUnit>& onlyCaller);

/*** ReportMetricsIfRequested: Print metrics as text and/or JSON per CLI flags. */
void ReportMetricsIfRequested(const cli::Options& opts, const obs::Metrics& metrics, std::ostream& out);

/***
 * Name: archlink::driver::Run
 * Purpose: Import the given dumps and print the resolved model.
 * Outputs: 0 on success, 2 on usage or input errors, 1 on model inconsistencies
 */
int Run(const cli::Options& opts);

}  // namespace driver
}  // namespace archlink
