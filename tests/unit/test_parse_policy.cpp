#include "delim_scanner/automaton.hpp"
#include "delim_scanner/jsonl_writer.hpp"
#include "delim_scanner/parse_policy.hpp"
#include "delim_scanner/record_view.hpp"
#include <iostream>
#include <string>
#include <vector>

static int failures = 0;

static void check(bool cond, const std::string& what) {
  if (cond) { std::cout << "[PASS] " << what << "\n"; return; }
  std::cerr << "[FAIL] " << what << "\n";
  ++failures;
}

int main(){
  using K = ds::ParsePolicy::Kind;
  ds::ParsePolicy pol;

  check(pol.parse_number("42").value_or(0) == 42.0, "integer");
  check(pol.parse_number("-1.5e3").value_or(0) == -1500.0, "exponent");
  check(!pol.parse_number("12abc"), "trailing garbage rejected");
  check(!pol.parse_number(""), "empty is not a number");
  check(!pol.parse_number(" 7"), "leading space rejected");

  check(pol.parse_bool("TRUE").value_or(false), "bool true, any case");
  check(!pol.parse_bool("False").value_or(true), "bool false");
  check(!pol.parse_bool("yes"), "unknown bool token");

  check(pol.classify("") == K::Null && pol.classify("NA") == K::Null, "null tokens");
  check(pol.classify("true") == K::Bool, "bool kind");
  check(pol.classify("3.25") == K::Number, "number kind");
  check(pol.classify("inf") == K::String, "non-finite numbers stay strings");
  check(pol.classify("hello") == K::String, "string kind");

  ds::ParsePolicy strict;
  strict.bools.case_sensitive = true;
  strict.bools.true_tokens = {"Y"};
  strict.bools.false_tokens = {"N"};
  check(strict.parse_bool("Y").value_or(false) && !strict.parse_bool("y"), "custom case-sensitive tokens");

  // JSON rendering of records.
  const std::vector<std::string> header = {"id", "name", "ok"};
  const std::vector<std::string> row = {"7", "a \"b\"\n", "true", "extra"};
  const ds::RecordView with(&header, &row);
  const ds::RecordView without(nullptr, &row);

  check(ds::record_to_json(without) == "[\"7\",\"a \\\"b\\\"\\n\",\"true\",\"extra\"]", "array without header");
  check(ds::record_to_json(with) == "{\"id\":\"7\",\"name\":\"a \\\"b\\\"\\n\",\"ok\":\"true\",\"_3\":\"extra\"}",
        "object keyed by header, surplus field by index");
  check(ds::record_to_json(with, &pol) == "{\"id\":7,\"name\":\"a \\\"b\\\"\\n\",\"ok\":true,\"_3\":\"extra\"}",
        "typed values unquoted");

  std::string esc;
  ds::json_escape(esc, std::string("a\x01", 2));
  check(esc == "\"a\\u0001\"", "control characters escaped");

  esc.clear();
  ds::json_escape(esc, "x</script>");
  check(esc == "\"x\\u003c/script>\"", "'<' escaped so JSON cannot close a script block");

  ds::ErrorInfo e;
  e.line = 3; e.column = 2; e.state = ds::State::InUnquotedField; e.offset = 10;
  e.input = "x\"y"; e.span = "\"y";
  check(ds::error_to_json(e) ==
        "{\"error\":{\"line\":3,\"column\":2,\"state\":\"in_unquoted_field\",\"offset\":10,"
        "\"input\":\"x\\\"y\",\"span\":\"\\\"y\"}}", "error line");

  if (failures) { std::cerr << failures << " check(s) failed\n"; return 1; }
  return 0;
}
