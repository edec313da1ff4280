/***
 * Name: tyflow::obs::Metrics (impl)
 * Purpose: Timer bookkeeping, summaries and hints.
 */
#include "observability/Metrics.h"

#include <iomanip>
#include <ios>
#include <sstream>
#include <string>
#include <utility>

namespace tyflow::obs {

namespace {

constexpr double kUsPerMs = 1000.0;

uint64_t lookup(const std::map<std::string, uint64_t>& values, const std::string& key) {
  const auto iter = values.find(key);
  return iter == values.end() ? 0U : iter->second;
}

std::string millis(uint64_t micros) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(3) << static_cast<double>(micros) / kUsPerMs;
  return oss.str();
}

// `"name": { "k": v, ... }`; stage values are written in milliseconds.
void writeJsonObject(std::ostringstream& oss, const char* name, const std::map<std::string, uint64_t>& values,
                     bool as_millis) {
  oss << "  \"" << name << "\": {";
  const char* sep = "";
  for (const auto& [key, val] : values) {
    oss << sep << "\n    \"" << key << "\": " << (as_millis ? millis(val) : std::to_string(val));
    sep = ",";
  }
  oss << (values.empty() ? "}" : "\n  }");
}

} // namespace

Metrics::Timer::~Timer() {
  const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - begin_).count();
  owner_->stages_us_[stage_] += static_cast<uint64_t>(elapsed);
}

uint64_t Metrics::counter(const std::string& key) const { return lookup(counters_, key); }

uint64_t Metrics::gauge(const std::string& key) const { return lookup(gauges_, key); }

uint64_t Metrics::elapsedMicros(const std::string& stage) const { return lookup(stages_us_, stage); }

std::string Metrics::summaryText() const {
  std::ostringstream oss;
  oss << "== Metrics ==\n";
  for (const auto& [stage, micros] : stages_us_) oss << "  " << stage << ": " << millis(micros) << " ms\n";
  for (const auto& [key, val] : counters_) oss << "  " << key << " = " << val << "\n";
  for (const auto& [key, val] : gauges_) oss << "  " << key << " ~ " << val << "\n";
  return oss.str();
}

std::string Metrics::summaryJson() const {
  std::ostringstream oss;
  oss << "{\n";
  writeJsonObject(oss, "stages_ms", stages_us_, true);
  oss << ",\n";
  writeJsonObject(oss, "counters", counters_, false);
  oss << ",\n";
  writeJsonObject(oss, "gauges", gauges_, false);
  oss << ",\n  \"hints\": [";
  const char* sep = "";
  for (const auto& hint : hints()) {
    oss << sep << "\"" << hint << "\"";
    sep = ", ";
  }
  oss << "]\n}\n";
  return oss.str();
}

std::vector<std::string> Metrics::hints() const {
  std::vector<std::string> out;
  if (counter("analyzer.diagnostics") > 0) { out.emplace_back("analysis_diagnostics_present"); }
  if (counter("ty.escalations.error") > 0) { out.emplace_back("precision_lost_to_error"); }
  const uint64_t built = counter("ty.unions_built");
  const uint64_t widened = counter("ty.escalations.any") + counter("ty.escalations.unknown");
  if (built + widened > 0) { out.emplace_back(widened > built ? "mostly_widened" : "mostly_precise"); }
  return out;
}

} // namespace tyflow::obs
