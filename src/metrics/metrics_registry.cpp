#include "row_reader/metrics.hpp"
#include <algorithm>
#include <chrono>

namespace rr {

void MetricsRegistry::reset() {
  rows_ = bytes_ = 0;
  field_errs_.clear();
  stage_order_.clear();
  stage_accum_ms_.clear();
  stage_starts_.clear();
}

void MetricsRegistry::start_stage(std::string_view name) {
  auto key = std::string(name);
  if (std::find(stage_order_.begin(), stage_order_.end(), key) == stage_order_.end())
    stage_order_.push_back(key);
  stage_starts_[key] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  stage_accum_ms_[key] += std::chrono::duration<double, std::milli>(
                            std::chrono::steady_clock::now() - it->second).count();
  stage_starts_.erase(it);
}

void MetricsRegistry::add_field_error(std::string_view field) {
  ++field_errs_[std::string(field)];
}

std::uint64_t MetricsRegistry::field_errors() const noexcept {
  std::uint64_t n = 0;
  for (auto& kv : field_errs_) n += kv.second;
  return n;
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.rows = rows_;
  r.bytes = bytes_;
  const double sec = wall_ms / 1000.0;
  r.throughput_mb_s = (sec > 0.0) ? (bytes_ / (1024.0*1024.0)) / sec : 0.0;
  r.rows_per_sec = (sec > 0.0) ? rows_ / sec : 0.0;

  r.errors_by_field = field_errs_;
  r.stages.reserve(stage_order_.size());
  for (auto& name : stage_order_) {
    auto it = stage_accum_ms_.find(name);
    r.stages.push_back(StageTiming{name, it == stage_accum_ms_.end() ? 0.0 : it->second});
  }
  return r;
}

}
