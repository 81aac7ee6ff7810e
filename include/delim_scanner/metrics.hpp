#pragma once
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ds {

struct StageTiming {
  std::string name;
  std::uint64_t duration_ms = 0;
};

struct RunStats {
  std::uint64_t records = 0;
  std::uint64_t fields = 0;
  std::uint64_t errors = 0;
  std::uint64_t bytes = 0;
  std::uint64_t chunks = 0;
  double throughput_mb_s = 0.0;
  double records_per_sec = 0.0;

  std::vector<StageTiming> stages;
  std::unordered_map<std::string, std::uint64_t> errors_by_state;
};

class MetricsRegistry {
public:
  void reset();
  void add_record(std::uint64_t fields) noexcept { ++records_; fields_ += fields; }
  void add_chunk(std::uint64_t b) noexcept { ++chunks_; bytes_ += b; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  // Keyed by the automaton state that detected the malformation.
  void add_error(std::string_view state);

  std::uint64_t records() const noexcept { return records_; }
  std::uint64_t errors() const noexcept { return errors_; }

  RunStats snapshot(double wall_ms) const;

private:
  std::uint64_t records_{0};
  std::uint64_t fields_{0};
  std::uint64_t errors_{0};
  std::uint64_t bytes_{0};
  std::uint64_t chunks_{0};
  std::unordered_map<std::string, std::uint64_t> state_errs_;
  std::unordered_map<std::string, std::uint64_t> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
