#include "delim_scanner/metrics.hpp"
#include <chrono>

namespace ds {

void MetricsRegistry::reset() {
  records_ = fields_ = errors_ = bytes_ = chunks_ = 0;
  state_errs_.clear();
  stage_accum_ms_.clear();
  stage_starts_.clear();
}

void MetricsRegistry::start_stage(std::string_view name) {
  stage_starts_[std::string(name)] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  stage_accum_ms_[key] += static_cast<std::uint64_t>(ms);
  stage_starts_.erase(it);
}

void MetricsRegistry::add_error(std::string_view state) {
  ++errors_;
  ++state_errs_[std::string(state)];
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.records = records_;
  r.fields = fields_;
  r.errors = errors_;
  r.bytes = bytes_;
  r.chunks = chunks_;
  const double sec = wall_ms / 1000.0;
  r.throughput_mb_s = (sec > 0.0) ? (bytes_ / (1024.0*1024.0)) / sec : 0.0;
  r.records_per_sec = (sec > 0.0) ? records_ / sec : 0.0;

  r.errors_by_state = state_errs_;
  r.stages.reserve(stage_accum_ms_.size());
  for (auto& kv : stage_accum_ms_) r.stages.push_back(StageTiming{kv.first, kv.second});
  return r;
}

}
