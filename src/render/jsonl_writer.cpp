#include "delim_scanner/jsonl_writer.hpp"
#include "delim_scanner/automaton.hpp"
#include "delim_scanner/parse_policy.hpp"
#include <charconv>
#include <cstdio>

namespace ds {

void json_escape(std::string& out, std::string_view s) {
  out.push_back('"');
  for (char c : s) {
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '"':  out += "\\\""; break;
      case '\n': out += "\\n";  break;
      case '\r': out += "\\r";  break;
      case '\t': out += "\\t";  break;
      case '<':  out += "\\u003c"; break; // output may sit inside <script>
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char tmp[8];
          std::snprintf(tmp, sizeof(tmp), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += tmp;
        } else {
          out.push_back(c);
        }
        break;
    }
  }
  out.push_back('"');
}

static void put_value(std::string& out, std::string_view v, const ParsePolicy* policy) {
  if (!policy) { json_escape(out, v); return; }
  switch (policy->classify(v)) {
    case ParsePolicy::Kind::Null:
      out += "null";
      return;
    case ParsePolicy::Kind::Bool:
      out += *policy->parse_bool(v) ? "true" : "false";
      return;
    case ParsePolicy::Kind::Number: {
      char tmp[64];
      auto [ptr, ec] = std::to_chars(tmp, tmp + sizeof(tmp), *policy->parse_number(v));
      if (ec == std::errc()) { out.append(tmp, ptr); return; }
      break;
    }
    case ParsePolicy::Kind::String:
      break;
  }
  json_escape(out, v);
}

std::string record_to_json(const RecordView& rv, const ParsePolicy* policy) {
  std::string out;
  if (!rv.has_header()) {
    out.push_back('[');
    for (std::size_t i = 0; i < rv.size(); ++i) {
      if (i) out.push_back(',');
      put_value(out, rv.at(i), policy);
    }
    out.push_back(']');
    return out;
  }
  out.push_back('{');
  for (std::size_t i = 0; i < rv.size(); ++i) {
    if (i) out.push_back(',');
    if (i < rv.header()->size()) json_escape(out, rv.colname(i));
    else json_escape(out, "_" + std::to_string(i));
    out.push_back(':');
    put_value(out, rv.at(i), policy);
  }
  out.push_back('}');
  return out;
}

std::string error_to_json(const ErrorInfo& e) {
  std::string out = "{\"error\":{\"line\":" + std::to_string(e.line) +
                    ",\"column\":" + std::to_string(e.column) +
                    ",\"state\":";
  json_escape(out, state_name(e.state));
  out += ",\"offset\":" + std::to_string(e.offset) + ",\"input\":";
  json_escape(out, e.input);
  out += ",\"span\":";
  json_escape(out, e.span);
  out += "}}";
  return out;
}

}
