#include "babylonify/debug.h"

#include <cstdarg>

namespace babylonify {

void DebugTrace::log(const char* format, ...) const {
  if (!config_.verbose || config_.output == nullptr)
    return;

  std::fprintf(config_.output, "[babylonify] ");
  va_list args;
  va_start(args, format);
  std::vfprintf(config_.output, format, args);
  va_end(args);
  std::fprintf(config_.output, "\n");
}

void DebugTrace::start_phase(const std::string& name) {
  if (!config_.timing)
    return;
  current_phase_ = name;
  phase_start_ = std::chrono::steady_clock::now();
}

void DebugTrace::end_phase(uint64_t rows_processed) {
  if (!config_.timing || current_phase_.empty())
    return;
  auto elapsed = std::chrono::steady_clock::now() - phase_start_;
  phase_times_.push_back(
      {current_phase_, std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed), rows_processed});
  current_phase_.clear();
}

void DebugTrace::print_timing_summary() const {
  if (!config_.timing || config_.output == nullptr || phase_times_.empty())
    return;

  std::fprintf(config_.output, "[babylonify] === Timing Summary ===\n");
  std::chrono::nanoseconds total{0};
  for (const auto& phase : phase_times_) {
    double ms = static_cast<double>(phase.duration.count()) / 1e6;
    std::fprintf(config_.output, "[babylonify] %-24s %10.3f ms", phase.name.c_str(), ms);
    if (phase.rows_processed > 0 && phase.duration.count() > 0) {
      double rows_per_sec =
          static_cast<double>(phase.rows_processed) / (static_cast<double>(phase.duration.count()) / 1e9);
      std::fprintf(config_.output, "  (%.0f rows/s)", rows_per_sec);
    }
    std::fprintf(config_.output, "\n");
    total += phase.duration;
  }
  std::fprintf(config_.output, "[babylonify] %-24s %10.3f ms\n", "total",
               static_cast<double>(total.count()) / 1e6);
}

} // namespace babylonify
