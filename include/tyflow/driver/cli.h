/***
 * Name: tyflow::driver (cli)
 * Purpose: Declarations for CLI options, parsing, and usage printing.
 * Inputs: N/A (declarations only)
 * Outputs: Types and functions for CLI handling.
 * Theory of Operation: Options are described once, in the flag table
 *   (cli_parse.h); parsing and usage text are both driven from it.
 */
#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace tyflow {
namespace driver {

/***
 * Name: tyflow::driver::CliOptions
 * Purpose: Hold parsed command-line options for a tyflow invocation.
 * Inputs: Values are populated by ParseCli.
 * Outputs: Consumed by RunOnce to control which union operations run.
 * Theory of Operation: Positional arguments are type spellings; every other
 *   token is a flag.
 */
struct CliOptions {
  std::vector<std::string> types;        // Positional type spellings
  bool show_help = false;                // -h, --help
  bool metrics = false;                  // --metrics
  enum class MetricsFormat { Text, Json };
  MetricsFormat metrics_format = MetricsFormat::Text; // --metrics[=json|text]
  bool optional = false;                 // --optional
  std::optional<std::string> property;   // --property=<key> | --property <key>
  std::string log_path;                  // --log-path=<dir>
  bool log_types = false;                // --log-types (requires --log-path)
};

/***
 * Name: tyflow::driver::ParseCli
 * Purpose: Parse command-line arguments into a CliOptions structure.
 * Inputs:
 *   - argc: Argument count
 *   - argv: Argument vector
 *   - dst: Output options structure to populate
 *   - err: Stream for diagnostics on parse errors
 * Outputs:
 *   - bool: true on successful parse, false if an error occurs
 * Theory of Operation: Iterates arguments left-to-right. Tokens matching the
 *   flag table apply their flag; "--" ends option processing; a '-' token that
 *   is not a negative number is an unknown option; everything else is a type
 *   spelling. -h/--help stops parsing immediately.
 */
bool ParseCli(int argc, const char* const* argv, CliOptions& dst, std::ostream& err);

/***
 * Name: tyflow::driver::PrintUsage
 * Purpose: Print CLI usage information for tyflow.
 * Inputs:
 *   - out: Destination stream
 *   - argv0: Program name used in usage examples
 * Outputs: None
 */
void PrintUsage(std::ostream& out, const char* argv0);

}  // namespace driver
}  // namespace tyflow
