/***
 * Name: tyflow::driver::detail (flag table)
 * Purpose: Define every tyflow option and match argv tokens against them.
 */
#include "tyflow/driver/cli_parse.h"

#include <array>
#include <string>

namespace tyflow::driver::detail {

namespace {

bool ApplyHelp(CliOptions& dst, std::optional<std::string_view>, std::ostream&) {
  dst.show_help = true;
  return true;
}

bool ApplyOptional(CliOptions& dst, std::optional<std::string_view>, std::ostream&) {
  dst.optional = true;
  return true;
}

bool ApplyProperty(CliOptions& dst, std::optional<std::string_view> value, std::ostream& err) {
  if (value->empty()) {
    err << "tyflow: error: empty property key" << '\n';
    return false;
  }
  dst.property = std::string(*value);
  return true;
}

bool ApplyLogPath(CliOptions& dst, std::optional<std::string_view> value, std::ostream& err) {
  if (value->empty()) {
    err << "tyflow: error: empty log directory" << '\n';
    return false;
  }
  dst.log_path = std::string(*value);
  return true;
}

bool ApplyLogTypes(CliOptions& dst, std::optional<std::string_view>, std::ostream&) {
  dst.log_types = true;
  return true;
}

bool ApplyMetrics(CliOptions& dst, std::optional<std::string_view> value, std::ostream& err) {
  dst.metrics = true;
  if (!value || *value == "text") {
    dst.metrics_format = CliOptions::MetricsFormat::Text;
  } else if (*value == "json") {
    dst.metrics_format = CliOptions::MetricsFormat::Json;
  } else {
    err << "tyflow: error: unknown metrics format '" << *value << "' (expected json or text)" << '\n';
    return false;
  }
  return true;
}

using Arity = FlagSpec::Arity;

constexpr std::array kFlags{
    FlagSpec{"--help", "-h", Arity::None, "", "Print this help and exit", ApplyHelp},
    FlagSpec{"--optional", "", Arity::None, "", "Widen the result with undefined", ApplyOptional},
    FlagSpec{"--property", "", Arity::Required, "key", "Print the type of reading <key> from the result", ApplyProperty},
    FlagSpec{"--log-path", "", Arity::Required, "dir", "Directory where logs are written", ApplyLogPath},
    FlagSpec{"--log-types", "", Arity::None, "", "Write the folded members to a types log (requires --log-path)",
             ApplyLogTypes},
    FlagSpec{"--metrics", "", Arity::Optional, "format", "Print metrics summary, json or text (default: text)",
             ApplyMetrics},
};

}  // namespace

std::span<const FlagSpec> Flags() { return kFlags; }

OptResult MatchFlag(const std::vector<std::string>& args, std::size_t& index, CliOptions& dst, std::ostream& err) {
  const std::string_view arg = args[index];
  for (const auto& flag : kFlags) {
    std::optional<std::string_view> value;
    if (arg == flag.name || (!flag.alias.empty() && arg == flag.alias)) {
      if (flag.arity == Arity::Required) {
        if (index + 1 >= args.size()) {
          err << "tyflow: error: missing " << flag.metavar << " after '" << flag.name << "'" << '\n';
          return OptResult::Error;
        }
        value = args[++index];
      }
    } else if (arg.size() > flag.name.size() && arg.starts_with(flag.name) && arg[flag.name.size()] == '=') {
      if (flag.arity == Arity::None) {
        err << "tyflow: error: option '" << flag.name << "' takes no value" << '\n';
        return OptResult::Error;
      }
      value = arg.substr(flag.name.size() + 1);
    } else {
      continue;
    }
    return flag.apply(dst, value, err) ? OptResult::Handled : OptResult::Error;
  }
  return OptResult::NotMatched;
}

std::string UsageSpelling(const FlagSpec& flag) {
  std::string out;
  if (!flag.alias.empty()) {
    out.append(flag.alias).append(", ");
  }
  out.append(flag.name);
  switch (flag.arity) {
    case Arity::None: break;
    case Arity::Required: out.append("=<").append(flag.metavar).append(">"); break;
    case Arity::Optional: out.append("[=<").append(flag.metavar).append(">]"); break;
  }
  return out;
}

}  // namespace tyflow::driver::detail
