/***
 * Name: tyflow::driver::WriteRunLog
 * Purpose: Write one per-run log file named `<dir>/<YYYYmmdd-HHMMSS>-<stem>.log`.
 * Inputs:
 *   - dir: existing log directory (--log-path)
 *   - stem: log kind, e.g. "types"
 *   - text: full log contents
 * Outputs:
 *   - std::string: path of the written file
 * Theory of Operation: Local-time stamp, then a single binary write. The
 *   directory is not created; an unwritable path raises ConfigError.
 */
#include "tyflow/driver/app.h"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <ios>
#include <sstream>
#include <string>

#include "tyflow/exceptions/config_error.h"

namespace tyflow::driver {

auto WriteRunLog(const std::string& dir, const std::string& stem, const std::string& text) -> std::string {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm local{};
#if defined(_WIN32)
  localtime_s(&local, &now);
#else
  localtime_r(&now, &local);
#endif
  std::ostringstream path;
  path << dir;
  if (!dir.empty() && dir.back() != '/') {
    path << '/';
  }
  path << std::put_time(&local, "%Y%m%d-%H%M%S") << '-' << stem << ".log";

  std::ofstream file_stream(path.str(), std::ios::binary);
  if (!file_stream.good()) {
    throw exceptions::ConfigError("cannot open log file for write: " + path.str());
  }
  file_stream << text;
  if (!file_stream.good()) {
    throw exceptions::ConfigError("failed to write log file: " + path.str());
  }
  return path.str();
}

}  // namespace tyflow::driver
