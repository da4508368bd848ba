/***
 * Name: archlink::obs::Metrics
 * Purpose: Collect per-stage timings and resolution counters for visibility.
 * Inputs:
 *   - Calls to start/stop timers for named stages.
 *   - Counter increments and gauges recorded by the import pipeline.
 * Outputs:
 *   - Human-readable text and JSON summaries.
 * Theory of Operation:
 *   Uses steady_clock timestamps to measure durations. Stores a map from
 *   stage names to microseconds. Not synchronised: the pipeline records from
 *   its orchestrating thread only, after resolver workers have joined.
 *   Formatting is performed on demand.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace archlink::obs {

class Metrics {
 public:
  using Clock = std::chrono::steady_clock;

  void start(const std::string& name);
  void stop(const std::string& name);

  // Generic counters/gauges for observability
  void incCounter(const std::string& key, uint64_t delta = 1) { counters_[key] += delta; }
  void setCounter(const std::string& key, uint64_t value) { counters_[key] = value; }
  void setGauge(const std::string& key, uint64_t value) { gauges_[key] = value; }
  uint64_t counter(const std::string& key) const;
  const auto& counters() const { return counters_; }
  const auto& gauges() const { return gauges_; }
  const auto& durations() const { return durations_us_; }

  std::string summaryText() const;
  std::string summaryJson() const;
  std::vector<std::string> hints() const;

 private:
  std::map<std::string, Clock::time_point> active_{};
  std::map<std::string, uint64_t> durations_us_{};
  std::map<std::string, uint64_t> counters_{};
  std::map<std::string, uint64_t> gauges_{};
};

/***
 * Name: archlink::obs::ScopedStage
 * Purpose: start() on construction, stop() on destruction.
 */
class ScopedStage {
 public:
  ScopedStage(Metrics& metrics, std::string name) : metrics_(metrics), name_(std::move(name)) { metrics_.start(name_); }
  ~ScopedStage() { metrics_.stop(name_); }

  ScopedStage(const ScopedStage&) = delete;
  ScopedStage& operator=(const ScopedStage&) = delete;

 private:
  Metrics& metrics_;
  std::string name_;
};

} // namespace archlink::obs
