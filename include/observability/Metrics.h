/***
 * Name: tyflow::obs::Metrics
 * Purpose: Counters, gauges and timings recorded by the type algebra, the
 *   analyzer and the CLI.
 * Inputs:
 *   - incCounter/setCounter/setGauge with dotted keys (`ty.unions_built`).
 *   - time(stage): RAII timer that adds its lifetime to the stage total.
 * Outputs:
 *   - Text and JSON summaries, and short hints derived from the counters.
 * Theory of Operation:
 *   Counters accumulate events, gauges hold the last observed size. All maps
 *   are ordered so summaries are stable. Nothing is formatted until asked.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace tyflow::obs {

class Metrics {
 public:
  using Clock = std::chrono::steady_clock;

  // Adds the time between construction and destruction to one stage.
  class Timer {
   public:
    Timer(Metrics& owner, std::string stage) : owner_(&owner), stage_(std::move(stage)), begin_(Clock::now()) {}
    ~Timer();
    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

   private:
    Metrics* owner_;
    std::string stage_;
    Clock::time_point begin_;
  };

  [[nodiscard]] Timer time(std::string stage) { return Timer(*this, std::move(stage)); }

  void incCounter(const std::string& key, uint64_t delta = 1) { counters_[key] += delta; }
  void setCounter(const std::string& key, uint64_t value) { counters_[key] = value; }
  void setGauge(const std::string& key, uint64_t value) { gauges_[key] = value; }
  uint64_t counter(const std::string& key) const;
  uint64_t gauge(const std::string& key) const;
  // Accumulated microseconds for a stage; 0 when it never ran.
  uint64_t elapsedMicros(const std::string& stage) const;

  std::string summaryText() const;
  std::string summaryJson() const;

  // Short machine-readable observations derived from counters.
  std::vector<std::string> hints() const;

 private:
  std::map<std::string, uint64_t> stages_us_{};
  std::map<std::string, uint64_t> counters_{};
  std::map<std::string, uint64_t> gauges_{};
};

} // namespace tyflow::obs
