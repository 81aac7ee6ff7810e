#include "delim_scanner/dsv_parser.hpp"
#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

static int failures = 0;

static void check(bool cond, const std::string& what) {
  if (cond) { std::cout << "[PASS] " << what << "\n"; return; }
  std::cerr << "[FAIL] " << what << "\n";
  ++failures;
}

struct Seen {
  std::vector<std::pair<ds::Record, std::uint64_t>> records;
  std::vector<ds::ErrorInfo> errors;
};

static ds::DsvConfig collecting(Seen& seen, ds::DsvConfig cfg = {}) {
  cfg.on_record = [&seen](const ds::Record& r, std::uint64_t line) {
    seen.records.emplace_back(r, line);
    return std::string();
  };
  cfg.on_error = [&seen](const ds::ErrorInfo& e) { seen.errors.push_back(e); };
  return cfg;
}

static Seen parse_all(std::string_view input, ds::DsvConfig cfg = {}, bool* finished = nullptr) {
  Seen seen;
  ds::DsvParser p(collecting(seen, std::move(cfg)));
  p.feed(input);
  const bool ok = p.finish();
  if (finished) *finished = ok;
  return seen;
}

static bool same(const ds::Record& a, std::initializer_list<const char*> b) {
  if (a.size() != b.size()) return false;
  std::size_t i = 0;
  for (const char* s : b) if (a[i++] != s) return false;
  return true;
}

int main(){
  // Default callbacks: records come back re-serialized, one per line.
  {
    ds::DsvParser p;
    const std::string out = p.feed("x,y\r\nz,\"a\"\"b\"\n");
    check(out == "\"x\",\"y\"\n\"z\",\"a\"\"b\"\n", "default on_record serializes each record");
    check(p.line() == 3 && p.column() == 0, "line advances once per record, CRLF counts once");
    check(p.bytes_consumed() == 14, "bytes_consumed counts the whole chunk");
    check(p.finish(), "finish after a terminated stream is accepting");
  }

  {
    Seen s = parse_all("x,y\r\nz,\"a\"\"b\"\n");
    check(s.records.size() == 2 && same(s.records[0].first, {"x", "y"}) && s.records[0].second == 1,
          "first record at line 1");
    check(s.records.size() == 2 && same(s.records[1].first, {"z", "a\"b"}) && s.records[1].second == 2,
          "doubled quote unescapes, second record at line 2");
    check(s.errors.empty(), "no errors on well-formed input");
  }

  {
    bool ok = false;
    Seen s = parse_all("a,b,c", {}, &ok);
    check(ok && s.records.size() == 1 && same(s.records[0].first, {"a", "b", "c"}),
          "finish flushes a trailing record without newline");
  }

  {
    bool ok = true;
    Seen s = parse_all("a,\"b", {}, &ok);
    check(!ok && s.records.empty() && s.errors.empty(), "unterminated quote: finish false, nothing emitted");
  }

  {
    ds::DsvConfig cfg; cfg.report_unterminated = true;
    bool ok = true;
    Seen s = parse_all("a,\"b", cfg, &ok);
    check(!ok && s.errors.size() == 1 && s.errors[0].state == ds::State::InQuotedField &&
          s.errors[0].input == "a,\"b", "report_unterminated raises for a dangling quoted field");
  }

  {
    Seen s = parse_all("\"multi\nline\",\"with,comma\"\n");
    check(s.records.size() == 1 && same(s.records[0].first, {"multi\nline", "with,comma"}),
          "delimiter and LF are literal inside quotes");
  }

  {
    Seen s = parse_all(",\n\n,,\n");
    check(s.records.size() == 3 && same(s.records[0].first, {"", ""}) &&
          same(s.records[1].first, {""}) && same(s.records[2].first, {"", "", ""}),
          "empty fields and empty lines");
  }

  {
    Seen s = parse_all("a\rb\r\rc\n");
    check(s.records.size() == 4 && same(s.records[0].first, {"a"}) && same(s.records[1].first, {"b"}) &&
          same(s.records[2].first, {""}) && same(s.records[3].first, {"c"}) && s.records[3].second == 4,
          "lone CR terminates records");
  }

  {
    bool ok = false;
    Seen s = parse_all("a,b\n", {}, &ok);
    check(ok && s.records.size() == 1, "no extra record after trailing newline");
    Seen t = parse_all("a,b\r", {}, &ok);
    check(ok && t.records.size() == 1, "no extra record after trailing CR");
  }

  {
    bool ok = false;
    Seen s = parse_all("\"q\"", {}, &ok);
    check(ok && s.records.size() == 1 && same(s.records[0].first, {"q"}), "closing quote at end of input is accepting");
  }

  {
    ds::DsvConfig cfg; cfg.quote = "";
    Seen s = parse_all("a\"b,\"c\n", cfg);
    check(s.errors.empty() && s.records.size() == 1 && same(s.records[0].first, {"a\"b", "\"c"}),
          "quote byte is data when quoting is disabled");
  }

  {
    ds::DsvConfig cfg; cfg.delimiter = "|"; cfg.quote = "'";
    Seen s = parse_all("'a|b'|c,d|'it''s'\n", cfg);
    check(s.records.size() == 1 && same(s.records[0].first, {"a|b", "c,d", "it's"}), "custom delimiter and quote");
  }

  {
    std::vector<std::pair<std::string, std::size_t>> fields;
    ds::DsvConfig cfg;
    cfg.on_field = [&](std::string_view f, std::size_t i, std::uint64_t) { fields.emplace_back(std::string(f), i); };
    cfg.on_record = [](const ds::Record&, std::uint64_t) { return std::string(); };
    ds::DsvParser p(cfg);
    p.feed("a,\"b\"\nc");
    check(fields.size() == 2 && fields[1].first == "b" && fields[1].second == 1, "on_field per committed field");
    check(p.record().empty() && p.field() == "c" && p.state() == ds::State::InUnquotedField,
          "partial field visible between feeds");
    p.finish();
    check(fields.size() == 3 && fields[2].first == "c" && fields[2].second == 0, "finish commits the last field");
  }

  {
    ds::DsvParser p;
    p.feed("a,b\nc,d\n");
    p.reset();
    check(p.line() == 1 && p.bytes_consumed() == 0 && p.state() == ds::State::FieldStart, "reset clears the session");
    ds::DsvConfig semi; semi.delimiter = ";"; semi.quote = "";
    p.reset(semi);
    check(p.delimiter() == ';' && !p.quote().has_value() && !p.quote_required(), "reset with config swaps dialect");
    check(p.feed("a;b\n") == "a;b\n", "new dialect in effect");
  }

  {
    ds::DsvParser a = ds::DsvParser::create(ds::DsvConfig{});
    a.feed("x,");
    ds::DsvParser b(std::move(a));
    check(b.record().size() == 1 && b.state() == ds::State::FieldStart, "moved parser keeps its session");
  }

  if (failures) { std::cerr << failures << " check(s) failed\n"; return 1; }
  return 0;
}
