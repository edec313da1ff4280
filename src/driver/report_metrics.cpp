/***
 * Name: tyflow::driver::ReportMetricsIfRequested
 * Purpose: Print metrics if enabled by CLI.
 * Inputs:
 *   - opts: CLI options containing metrics flags
 *   - metrics: collected metrics for this run
 *   - out: destination stream
 * Outputs: None
 * Theory of Operation: Prints the text summary (with hints) or the JSON summary.
 */
#include "tyflow/driver/app.h"
#include "observability/Metrics.h"

#include <ostream>

namespace tyflow::driver {

auto ReportMetricsIfRequested(const CliOptions& opts, const obs::Metrics& metrics, std::ostream& out) -> void {
  if (!opts.metrics) {
    return;
  }
  if (opts.metrics_format == CliOptions::MetricsFormat::Json) {
    out << metrics.summaryJson() << '\n';
    return;
  }
  out << metrics.summaryText();
  for (const auto& hint : metrics.hints()) {
    out << "hint: " << hint << '\n';
  }
}

}  // namespace tyflow::driver
