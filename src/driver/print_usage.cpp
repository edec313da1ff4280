/***
 * Name: tyflow::driver::PrintUsage
 * Purpose: Print CLI usage information for tyflow.
 * Inputs:
 *   - out: Destination stream
 *   - argv0: Program name used in usage examples
 * Outputs: None
 * Theory of Operation: Option lines are generated from the flag table so the
 *   help text cannot drift from what ParseCli accepts.
 */
#include "tyflow/driver/cli.h"
#include "tyflow/driver/cli_parse.h"

#include <cstddef>
#include <cstring>
#include <ostream>
#include <string>
#include <string_view>

namespace tyflow::driver {

static std::string_view Basename(const char* path) {
  if (path == nullptr || *path == '\0') {
    return std::string_view{"tyflow"};
  }
  const char* last_slash = std::strrchr(path, '/');
  return std::string_view(last_slash != nullptr ? last_slash + 1 : path);
}

auto PrintUsage(std::ostream& out, const char* argv0) -> void {
  constexpr std::size_t kColumn = 24;
  out << "Usage: " << Basename(argv0) << " [options] type..." << '\n'
      << '\n'
      << "Folds every type spelling into one union and prints it." << '\n'
      << '\n'
      << "Options:" << '\n';
  for (const auto& flag : detail::Flags()) {
    const std::string spelling = detail::UsageSpelling(flag);
    out << "  " << spelling << std::string(spelling.size() < kColumn ? kColumn - spelling.size() : 1, ' ') << flag.help
        << '\n';
  }
  out << "  --" << std::string(kColumn - 2, ' ') << "End of options" << '\n'
      << '\n'
      << "Type spellings:" << '\n'
      << "  string number bigint boolean symbol object void null undefined" << '\n'
      << "  any unknown never true false 'text' \"text\" 42 -1.5 7n" << '\n'
      << "  a|b" << std::string(kColumn - 3, ' ') << "Several members in one argument" << '\n';
}

}  // namespace tyflow::driver
