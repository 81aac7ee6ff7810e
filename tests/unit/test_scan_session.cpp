#include "delim_scanner/scan_session.hpp"
#include "delim_scanner/run_json.hpp"
#include <iostream>
#include <string>

static int failures = 0;

static void check(bool cond, const std::string& what) {
  if (cond) { std::cout << "[PASS] " << what << "\n"; return; }
  std::cerr << "[FAIL] " << what << "\n";
  ++failures;
}

static std::string scan(ds::ScanSession& s, std::string_view in, std::size_t step) {
  std::string out;
  for (std::size_t i = 0; i < in.size(); i += step) out += s.feed(in.substr(i, step));
  out += s.finish();
  return out;
}

int main(){
  const std::string input = "id,name,ok\n1,\"x,y\",true\n2,bad\"q,false\n3,z,NA\n4,w";

  {
    ds::ScanOptions o;
    o.dialect.header = true;
    o.inline_errors = true;
    ds::ScanSession s(o);
    const std::string out = scan(s, input, 5);
    const std::string expect =
      "{\"id\":\"1\",\"name\":\"x,y\",\"ok\":\"true\"}\n"
      "{\"error\":{\"line\":3,\"column\":6,\"state\":\"in_unquoted_field\",\"offset\":29,"
      "\"input\":\"2,bad\\\"q,false\",\"span\":\"\\\"q,false\"}}\n"
      "{\"id\":\"3\",\"name\":\"z\",\"ok\":\"NA\"}\n"
      "{\"id\":\"4\",\"name\":\"w\"}\n";
    check(out == expect, "JSONL keyed by header, errors inline and in order");
    if (out != expect) std::cerr << out;
    check(s.complete() && s.metrics().records() == 3 && s.metrics().errors() == 1, "record and error counts");
    check(s.error_samples().size() == 1 && s.error_samples()[0].line == 3, "error sample kept");

    const ds::RunJsonPayload p = s.payload(12.5);
    check(p.records == 3 && p.fields == 8 && p.errors == 1 && p.bytes == input.size() &&
          p.chunks == (input.size() + 4) / 5, "payload KPIs");
    check(p.header.size() == 3 && p.header[0] == "id" && p.delimiter == "," && p.encoding == "utf-8",
          "payload dialect and header");
    check(p.errors_by_state.count("in_unquoted_field") == 1, "errors grouped by state");
    const std::string js = ds::RunJsonWriter::to_json(p);
    check(js.find("\"records\":3") != std::string::npos &&
          js.find("\"dialect\":{\"delimiter\":\",\"") != std::string::npos, "run.json text");
  }

  {
    ds::ScanOptions o;
    o.typed = true;
    ds::ScanSession s(o);
    const std::string out = scan(s, "1,2.5,true,,text\n", 64);
    check(out == "[1,2.5,true,null,\"text\"]\n", "typed array output without header");
  }

  {
    ds::ScanOptions o;
    o.format = ds::OutputFormat::Csv;
    o.dialect.header = true;
    o.dialect.delimiter = ";";
    ds::ScanSession s(o);
    const std::string out = scan(s, "a;b\r\n1;\"x\"\"y\"\r\n", 3);
    check(out == "\"a\";\"b\"\n\"1\";\"x\"\"y\"\n", "CSV output keeps the header line");
  }

  {
    ds::ScanOptions o;
    o.format = ds::OutputFormat::None;
    o.dialect.report_unterminated = true;
    o.inline_errors = true;
    ds::ScanSession s(o);
    const std::string out = scan(s, "a,b\nc,\"open", 4);
    check(!s.complete() && s.metrics().records() == 1 && out.find("\"state\":\"in_quoted_field\"") != std::string::npos,
          "unterminated input reported at finish");
  }

  {
    ds::ScanOptions o;
    o.dialect.quote = o.dialect.delimiter;
    bool threw = false;
    try { ds::ScanSession s(o); } catch (const ds::ConfigError&) { threw = true; }
    check(threw, "invalid dialect rejected");
  }

  ds::OutputFormat f = ds::OutputFormat::None;
  check(ds::parse_output_format("csv", f) && f == ds::OutputFormat::Csv && !ds::parse_output_format("xml", f),
        "output format names");

  if (failures) { std::cerr << failures << " check(s) failed\n"; return 1; }
  return 0;
}
