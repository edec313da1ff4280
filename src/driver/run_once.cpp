/***
 * Name: tyflow::driver::RunOnce
 * Purpose: Execute one fold from type spellings to printed result.
 * Inputs:
 *   - opts: CLI options
 *   - metrics: sink for ty.* counters and the fold timer
 *   - out: destination for the printed type
 * Outputs:
 *   - int: 0 on success
 * Theory of Operation: Stages run in order (parse -> fold -> widen -> read ->
 *   print); spelling errors propagate as ConfigError to main().
 */
#include "tyflow/driver/app.h"

#include <ostream>
#include <sstream>
#include <string>
#include <vector>

#include "observability/Metrics.h"
#include "tyflow/support/type_spelling.h"
#include "ty/TypeArena.h"
#include "ty/TypeContext.h"
#include "ty/TypePrinter.h"

namespace tyflow::driver {

auto RunOnce(const CliOptions& opts, obs::Metrics& metrics, std::ostream& out) -> int {
  ty::TypeArena arena;
  ty::TypeContext types(arena, &metrics);

  std::vector<ty::Ty> members;
  ty::Ty result;
  {
    auto timer = metrics.time("fold");
    members = support::ParseTypeList(opts.types, arena);
    result = types.intoUnion(members);
    if (opts.optional) {
      result = types.getOptionalType(true, result);
    }
    if (opts.property) {
      result = types.getProperty(result, ty::PropertyKey::named(*opts.property));
    }
  }
  metrics.setGauge("ty.arena_nodes", static_cast<uint64_t>(arena.size()));
  metrics.setCounter("cli.members", static_cast<uint64_t>(members.size()));

  const std::string printed = ty::typeToString(result);
  if (opts.log_types) {
    std::ostringstream log;
    for (const auto& member : members) {
      log << "member " << ty::typeToString(member) << '\n';
    }
    log << "result " << printed << '\n';
    WriteRunLog(opts.log_path, "types", log.str());
  }
  out << printed << '\n';
  return 0;
}

}  // namespace tyflow::driver
