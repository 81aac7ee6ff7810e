#include "delim_scanner/dialect.hpp"
#include <simdjson.h>
#include <string>
#include <utility>

namespace ds {

void Dialect::apply(DsvConfig& cfg) const {
  cfg.delimiter = delimiter;
  cfg.quote = quote;
  cfg.quote_required = quote_required;
  cfg.encoding = encoding;
  cfg.strip_bom = strip_bom;
  cfg.report_unterminated = report_unterminated;
}

static bool fail(std::string* err_out, std::string msg) {
  if (err_out) *err_out = std::move(msg);
  return false;
}

static bool read_dialect(simdjson::ondemand::document& doc, Dialect& out, std::string* err_out) {
  using simdjson::ondemand::json_type;
  Dialect d = out;
  simdjson::ondemand::object obj = doc.get_object();
  for (auto field : obj) {
    std::string_view key = field.unescaped_key();
    simdjson::ondemand::value v = field.value();
    const json_type t = v.type().value();

    if (key == "delimiter") {
      if (t != json_type::string) return fail(err_out, "delimiter must be a string");
      d.delimiter = std::string(std::string_view(v.get_string()));
    } else if (key == "quote") {
      if (t == json_type::null) { d.quote.clear(); continue; }
      if (t != json_type::string) return fail(err_out, "quote must be a string or null");
      d.quote = std::string(std::string_view(v.get_string()));
    } else if (key == "encoding") {
      if (t != json_type::string) return fail(err_out, "encoding must be a string");
      std::string_view name = v.get_string();
      if (!parse_encoding(name, d.encoding)) return fail(err_out, "unsupported encoding: " + std::string(name));
    } else if (key == "quote_required" || key == "strip_bom" ||
               key == "report_unterminated" || key == "header") {
      if (t != json_type::boolean) return fail(err_out, std::string(key) + " must be a boolean");
      bool b = v.get_bool();
      if (key == "quote_required") d.quote_required = b;
      else if (key == "strip_bom") d.strip_bom = b;
      else if (key == "report_unterminated") d.report_unterminated = b;
      else d.header = b;
    }
  }
  out = d;
  return true;
}

bool parse_dialect(std::string_view json, Dialect& out, std::string* err_out) {
  simdjson::ondemand::parser parser;
  simdjson::padded_string padded(json);
  try {
    auto doc = parser.iterate(padded);
    return read_dialect(doc.value(), out, err_out);
  } catch (const simdjson::simdjson_error& e) {
    return fail(err_out, std::string("invalid dialect JSON: ") + e.what());
  }
}

bool load_dialect(const std::string& path, Dialect& out, std::string* err_out) {
  simdjson::padded_string json;
  if (auto ec = simdjson::padded_string::load(path).get(json)) {
    return fail(err_out, "cannot read " + path + ": " + simdjson::error_message(ec));
  }
  return parse_dialect(std::string_view(json.data(), json.size()), out, err_out);
}

}
