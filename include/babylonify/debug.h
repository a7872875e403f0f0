/**
 * @file debug.h
 * @brief Verbose tracing and phase timing for filter runs.
 *
 * Trace lines go to a FILE* (stderr by default) prefixed with "[babylonify]".
 * Result lines for the user are printed by the CLI, not here.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace babylonify {

struct DebugConfig {
  bool verbose = false; ///< Emit log() lines
  bool timing = false;  ///< Record phase timings
  FILE* output = stderr;

  bool enabled() const { return verbose || timing; }

  static DebugConfig all() {
    DebugConfig config;
    config.verbose = true;
    config.timing = true;
    return config;
  }
};

struct PhaseTime {
  std::string name;
  std::chrono::nanoseconds duration{0};
  uint64_t rows_processed = 0;
};

class DebugTrace {
public:
  DebugTrace() = default;
  explicit DebugTrace(const DebugConfig& config) : config_(config) {}

  bool verbose() const { return config_.verbose; }
  bool timing() const { return config_.timing; }

  /// printf-style trace line; no-op unless verbose.
#if defined(__GNUC__)
  __attribute__((format(printf, 2, 3)))
#endif
  void log(const char* format, ...) const;

  void start_phase(const std::string& name);
  void end_phase(uint64_t rows_processed = 0);

  const std::vector<PhaseTime>& get_phase_times() const { return phase_times_; }

  /// Per-phase totals and rows/second; no-op unless timing.
  void print_timing_summary() const;

private:
  DebugConfig config_;
  std::vector<PhaseTime> phase_times_;
  std::string current_phase_;
  std::chrono::steady_clock::time_point phase_start_;
};

} // namespace babylonify
