#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ds {

struct RunJsonErrorSample {
  std::uint64_t line = 0;
  std::uint64_t column = 0;
  std::string state;
  std::string input;
};

struct RunJsonPayload {
  // Top-level KPIs
  std::uint64_t records = 0;
  std::uint64_t fields = 0;
  std::uint64_t errors = 0;
  std::uint64_t bytes = 0;
  std::uint64_t chunks = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;
  double records_per_sec = 0.0;
  bool complete = true; // trailing input flushed by finish()

  // Stages and errors
  std::vector<std::pair<std::string, std::uint64_t>> stage_times;
  std::unordered_map<std::string, std::uint64_t> errors_by_state;
  std::vector<RunJsonErrorSample> error_samples;

  // Dialect
  std::string delimiter;
  std::string quote;
  bool quote_required = false;
  std::string encoding;
  std::vector<std::string> header;

  // Input metadata
  std::string filename;
  std::string content_type;
  std::uint64_t file_size = 0;
};

class RunJsonWriter {
public:
  // Serialize payload to a compact JSON string.
  static std::string to_json(const RunJsonPayload& p);
};

}
