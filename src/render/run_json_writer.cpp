#include "delim_scanner/run_json.hpp"
#include "delim_scanner/jsonl_writer.hpp"
#include <sstream>
#include <cmath> // std::isfinite

namespace ds {

static void esc(std::ostringstream& o, std::string_view s){
  std::string tmp;
  json_escape(tmp, s);
  o << tmp;
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string RunJsonWriter::to_json(const RunJsonPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"records\":" << p.records << ",";
  o << "\"fields\":" << p.fields << ",";
  o << "\"errors\":" << p.errors << ",";
  o << "\"bytes\":" << p.bytes << ",";
  o << "\"chunks\":" << p.chunks << ",";
  o << "\"wall_time_ms\":" << safe_num(p.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(p.throughput_mb_s) << ",";
  o << "\"records_per_sec\":" << safe_num(p.records_per_sec) << ",";
  o << "\"complete\":" << (p.complete ? "true" : "false") << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<p.stage_times.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, p.stage_times[i].first);
    o << ",\"duration_ms\":" << p.stage_times[i].second << "}";
  }
  o << "],";

  o << "\"errors_by_state\":{";
  bool first=true;
  for (auto& kv : p.errors_by_state) {
    if (!first) o << ",";
    first=false;
    esc(o, kv.first); o << ":" << kv.second;
  }
  o << "},";

  o << "\"error_samples\":[";
  for (size_t i=0;i<p.error_samples.size();++i){
    if (i) o << ",";
    const auto& s = p.error_samples[i];
    o << "{\"line\":" << s.line << ",\"column\":" << s.column << ",\"state\":";
    esc(o, s.state);
    o << ",\"input\":";
    esc(o, s.input);
    o << "}";
  }
  o << "],";

  o << "\"dialect\":{\"delimiter\":"; esc(o, p.delimiter);
  o << ",\"quote\":";                 esc(o, p.quote);
  o << ",\"quote_required\":" << (p.quote_required ? "true" : "false");
  o << ",\"encoding\":";              esc(o, p.encoding);
  o << "},";

  o << "\"header\":[";
  for (size_t i=0;i<p.header.size();++i){
    if (i) o << ",";
    esc(o, p.header[i]);
  }
  o << "],";

  o << "\"filename\":";     esc(o, p.filename);     o << ",";
  o << "\"content_type\":"; esc(o, p.content_type); o << ",";
  o << "\"file_size\":" << p.file_size;

  o << "}";
  return o.str();
}

}
