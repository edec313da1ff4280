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
 * Theory of Operation:
 *   Flags first, then "--", then positional spellings. Cross-option
 *   constraints are checked once every token has been seen.
 */
#include "tyflow/driver/cli.h"
#include "tyflow/driver/cli_parse.h"

#include <cctype>
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace tyflow::driver {

namespace {

// "-1.5" and "-.5" are numeric literal spellings, not options.
bool IsNegativeNumber(const std::string& arg) {
  return arg.size() > 1 && arg[0] == '-' && (std::isdigit(static_cast<unsigned char>(arg[1])) != 0 || arg[1] == '.');
}

}  // namespace

auto ParseCli(int argc, const char* const* argv, CliOptions& dst, std::ostream& err) -> bool {
  dst = CliOptions{};

  std::vector<std::string> args;
  args.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    const char* arg_ptr = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    args.emplace_back(arg_ptr == nullptr ? "" : arg_ptr);
  }

  bool options_done = false;
  for (std::size_t index = 1; index < args.size(); ++index) {
    const std::string& arg = args[index];
    if (!options_done) {
      if (arg == "--") {
        options_done = true;
        continue;
      }
      const detail::OptResult matched = detail::MatchFlag(args, index, dst, err);
      if (matched == detail::OptResult::Error) {
        return false;
      }
      if (dst.show_help) {
        return true;
      }
      if (matched == detail::OptResult::Handled) {
        continue;
      }
      if (!arg.empty() && arg[0] == '-' && !IsNegativeNumber(arg)) {
        err << "tyflow: error: unknown option '" << arg << "'" << '\n';
        return false;
      }
    }
    if (!arg.empty()) {
      dst.types.push_back(arg);
    }
  }

  if (dst.types.empty()) {
    err << "tyflow: error: no type spellings given" << '\n';
    return false;
  }
  if (dst.log_types && dst.log_path.empty()) {
    err << "tyflow: error: --log-types requires --log-path=<dir>" << '\n';
    return false;
  }
  return true;
}

}  // namespace tyflow::driver
