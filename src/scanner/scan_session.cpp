#include "delim_scanner/scan_session.hpp"
#include "delim_scanner/jsonl_writer.hpp"
#include "delim_scanner/record_view.hpp"
#include <iostream>
#include <utility>

namespace ds {

bool parse_output_format(std::string_view name, OutputFormat& out) {
  if (name == "jsonl") { out = OutputFormat::Jsonl; return true; }
  if (name == "csv")   { out = OutputFormat::Csv;   return true; }
  if (name == "none")  { out = OutputFormat::None;  return true; }
  return false;
}

ScanSession::ScanSession(ScanOptions opts)
  : opts_(std::move(opts)), parser_(make_config()) {}

DsvConfig ScanSession::make_config() {
  DsvConfig cfg;
  opts_.dialect.apply(cfg);

  cfg.on_error = [this](const ErrorInfo& e) {
    metrics_.add_error(state_name(e.state));
    if (samples_.size() < opts_.max_error_samples) samples_.push_back(e);
    if (opts_.inline_errors) {
      pending_ += error_to_json(e);
      pending_.push_back('\n');
    } else {
      std::cerr << "[dsv] line " << e.line << ":" << e.column
                << " malformed field (" << state_name(e.state) << "): " << e.input << "\n";
    }
  };

  cfg.on_record = [this](const Record& r, std::uint64_t) {
    metrics_.add_record(r.size());
    std::string out;
    out.swap(pending_);
    switch (opts_.format) {
      case OutputFormat::Jsonl: {
        RecordView rv(opts_.dialect.header ? &parser_.header() : nullptr, &r);
        out += record_to_json(rv, opts_.typed ? &policy_ : nullptr);
        out.push_back('\n');
        break;
      }
      case OutputFormat::Csv:
        out += parser_.serialize(r);
        out.push_back('\n');
        break;
      case OutputFormat::None:
        break;
    }
    return out;
  };

  if (opts_.dialect.header) {
    // Header goes through to CSV output; JSONL uses it for keys instead.
    cfg.on_header = [this](const Record& h, std::uint64_t) {
      std::string out;
      out.swap(pending_);
      if (opts_.format == OutputFormat::Csv) {
        out += parser_.serialize(h);
        out.push_back('\n');
      }
      return out;
    };
  }
  return cfg;
}

std::string ScanSession::feed(std::string_view chunk) {
  metrics_.add_chunk(chunk.size());
  std::string out = parser_.feed(chunk);
  out += pending_;
  pending_.clear();
  return out;
}

std::string ScanSession::finish() {
  complete_ = parser_.finish();
  std::string out = parser_.parsed();
  out += pending_;
  pending_.clear();
  return out;
}

RunJsonPayload ScanSession::payload(double wall_ms) const {
  const RunStats s = metrics_.snapshot(wall_ms);
  RunJsonPayload p{};
  p.records = s.records;
  p.fields = s.fields;
  p.errors = s.errors;
  p.bytes = s.bytes;
  p.chunks = s.chunks;
  p.wall_time_ms = wall_ms;
  p.throughput_mb_s = s.throughput_mb_s;
  p.records_per_sec = s.records_per_sec;
  p.complete = complete_;
  for (const auto& st : s.stages) p.stage_times.emplace_back(st.name, st.duration_ms);
  p.errors_by_state = s.errors_by_state;
  for (const auto& e : samples_)
    p.error_samples.push_back(RunJsonErrorSample{e.line, e.column, state_name(e.state), e.input});

  p.delimiter = opts_.dialect.delimiter;
  p.quote = opts_.dialect.quote;
  p.quote_required = opts_.dialect.quote_required;
  p.encoding = encoding_name(opts_.dialect.encoding);
  p.header = parser_.header();
  return p;
}

}
