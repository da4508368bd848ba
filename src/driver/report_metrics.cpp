/***
 * Name: archlink::driver::ReportMetricsIfRequested
 * Purpose: Print metrics to the given stream if enabled by CLI.
 * Inputs:
 *   - opts: CLI options containing metrics flags
 *   - metrics: metrics of the finished import
 * Outputs: None
 */
#include "archlink/driver/app.h"

namespace archlink::driver {

auto ReportMetricsIfRequested(const cli::Options& opts, const obs::Metrics& metrics, std::ostream& out) -> void {
  if (opts.metrics) {
    out << metrics.summaryText();
  }
  if (opts.metricsJson) {
    out << metrics.summaryJson() << "\n";
  }
}

}  // namespace archlink::driver
