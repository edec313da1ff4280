/***
 * Name: tyflow::driver (app API)
 * Purpose: Declarations for top-level driver helpers used by main().
 * Inputs: CLI options, metrics sink, output streams
 * Outputs: Printed types, log files, status codes
 * Theory of Operation: Keep main() minimal by factoring helpers into separate
 *   translation units; one function per .cpp file.
 */
#pragma once

#include <iosfwd>
#include <string>

#include "tyflow/driver/cli.h"

namespace tyflow::obs { class Metrics; }

namespace tyflow {
namespace driver {

/***
 * Name: tyflow::driver::RunOnce
 * Purpose: Fold the requested spellings into one type and print it.
 * Inputs: opts (CLI options), metrics (sink for ty.* counters), out (result stream)
 * Outputs: POSIX status code (0 on success)
 * Theory of Operation: parse spellings -> intoUnion -> optional widening ->
 *   optional property read -> print. Bad spellings and log failures throw
 *   ConfigError.
 */
int RunOnce(const CliOptions& opts, obs::Metrics& metrics, std::ostream& out);

/***
 * Name: tyflow::driver::WriteRunLog
 * Purpose: Write `<dir>/<YYYYmmdd-HHMMSS>-<stem>.log` and return its path.
 * Theory of Operation: Throws ConfigError when the file cannot be written.
 */
std::string WriteRunLog(const std::string& dir, const std::string& stem, const std::string& text);

/***
 * Name: tyflow::driver::ReportMetricsIfRequested
 * Purpose: Emit metrics in the requested format if enabled.
 * Inputs: opts (CLI options), metrics, out
 * Outputs: None
 */
void ReportMetricsIfRequested(const CliOptions& opts, const obs::Metrics& metrics, std::ostream& out);

}  // namespace driver
}  // namespace tyflow
