#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include "delim_scanner/dialect.hpp"
#include "delim_scanner/dsv_parser.hpp"
#include "delim_scanner/metrics.hpp"
#include "delim_scanner/parse_policy.hpp"
#include "delim_scanner/run_json.hpp"

namespace ds {

enum class OutputFormat { Jsonl, Csv, None };

bool parse_output_format(std::string_view name, OutputFormat& out);

struct ScanOptions {
  Dialect dialect;
  OutputFormat format = OutputFormat::Jsonl;
  bool typed = false;          // JSONL numbers/bools/nulls unquoted
  bool inline_errors = false;  // errors as JSON lines in the output, else std::cerr
  std::size_t max_error_samples = 20;
};

// One stream through a DsvParser, rendering records as they complete and
// counting what went by. Output text keeps input order: an error raised
// between two records appears between them.
class ScanSession {
public:
  explicit ScanSession(ScanOptions opts); // throws ConfigError
  ScanSession(const ScanSession&) = delete;
  ScanSession& operator=(const ScanSession&) = delete;

  std::string feed(std::string_view chunk);
  std::string finish();

  bool complete() const noexcept { return complete_; }
  const MetricsRegistry& metrics() const noexcept { return metrics_; }
  MetricsRegistry& metrics() noexcept { return metrics_; }
  const std::vector<ErrorInfo>& error_samples() const noexcept { return samples_; }
  const DsvParser& parser() const noexcept { return parser_; }

  // KPIs, dialect, header and error samples; input metadata is the caller's.
  RunJsonPayload payload(double wall_ms) const;

private:
  DsvConfig make_config();

  ScanOptions opts_;
  ParsePolicy policy_;
  MetricsRegistry metrics_;
  std::vector<ErrorInfo> samples_;
  std::string pending_;
  bool complete_{true};
  DsvParser parser_; // last: its callbacks use the members above
};

}
