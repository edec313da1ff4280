/***
 * Name: tyflow::driver (flag table)
 * Purpose: The options tyflow accepts, described as data.
 * Inputs: Argument vector and position, CLI options destination, error stream
 * Outputs: detail::OptResult (NotMatched, Handled, Error)
 * Theory of Operation: Each FlagSpec names a spelling, whether it takes a
 *   value, the text shown by --help and the function that applies it.
 *   MatchFlag tries the table in order; ParseCli and PrintUsage share it.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "tyflow/driver/cli.h"

namespace tyflow {
namespace driver {
namespace detail {

enum class OptResult { NotMatched, Handled, Error };

struct FlagSpec {
  enum class Arity { None, Required, Optional };

  std::string_view name;     // long spelling, e.g. "--property"
  std::string_view alias;    // short spelling or empty
  Arity arity;
  std::string_view metavar;  // value name in usage and errors
  std::string_view help;
  // Value is nullopt for Arity::None and for a bare Arity::Optional flag.
  // Returns false after writing a message to err.
  bool (*apply)(CliOptions& dst, std::optional<std::string_view> value, std::ostream& err);
};

/*** Flags: the table, in usage order. */
std::span<const FlagSpec> Flags();

/*** MatchFlag: Apply args[index] (and a separate value, advancing index) when it names a flag. */
OptResult MatchFlag(const std::vector<std::string>& args, std::size_t& index, CliOptions& dst, std::ostream& err);

/*** UsageSpelling: "-h, --help", "--property=<key>", "--metrics[=<format>]". */
std::string UsageSpelling(const FlagSpec& flag);

}  // namespace detail
}  // namespace driver
}  // namespace tyflow
