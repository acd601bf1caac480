#pragma once
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rr {

struct StageTiming {
  std::string name;
  double duration_ms = 0.0;
};

struct RunStats {
  std::uint64_t rows = 0;
  std::uint64_t bytes = 0;
  double throughput_mb_s = 0.0;
  double rows_per_sec = 0.0;

  std::vector<StageTiming> stages;
  std::unordered_map<std::string, std::uint64_t> errors_by_field;
};

class MetricsRegistry {
public:
  void reset();
  void add_row() noexcept { ++rows_; }
  void set_bytes(std::uint64_t b) noexcept { bytes_ = b; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  void add_field_error(std::string_view field);
  std::uint64_t field_errors() const noexcept;

  RunStats snapshot(double wall_ms) const;

private:
  std::uint64_t rows_{0};
  std::uint64_t bytes_{0};
  std::unordered_map<std::string, std::uint64_t> field_errs_;
  std::vector<std::string> stage_order_;
  std::unordered_map<std::string, double> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
