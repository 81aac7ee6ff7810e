#include "delim_scanner/automaton.hpp"
#include "delim_scanner/dsv_config.hpp"
#include "delim_scanner/dsv_parser.hpp"
#include <cstring>
#include <iostream>
#include <string>

using ds::Action;
using ds::State;

static int failures = 0;

static void check(bool cond, const std::string& what) {
  if (cond) { std::cout << "[PASS] " << what << "\n"; return; }
  std::cerr << "[FAIL] " << what << "\n";
  ++failures;
}

static bool is(const ds::Rule& r, State next, Action a) { return r.next == next && r.action == a; }

static bool throws_config(ds::DsvConfig cfg) {
  try { ds::validate(cfg); } catch (const ds::ConfigError&) { return true; }
  return false;
}

int main(){
  const State all[] = {State::FieldStart, State::AfterCr, State::InUnquotedField, State::QuoteOpened,
                       State::InQuotedField, State::AfterClosingQuote, State::SkipToEol, State::SkipToEolAfterCr};

  for (const char* quote : {"\"", ""}) {
    ds::DsvConfig cfg; cfg.quote = quote;
    const ds::Automaton a = ds::build_automaton(cfg);
    bool one_default = true;
    for (State s : all) {
      const auto& rs = a.rules(s);
      std::size_t defaults = 0;
      for (const auto& r : rs) defaults += r.is_default() ? 1 : 0;
      if (rs.empty() || !rs.back().is_default() || defaults != 1) {
        std::cerr << "       state " << ds::state_name(s) << " rules=" << rs.size() << " defaults=" << defaults << "\n";
        one_default = false;
      }
    }
    check(one_default, std::string("every state ends with one default rule, quote=") + (*quote ? "on" : "off"));
  }

  ds::DsvConfig cfg;
  const ds::Automaton a = ds::build_automaton(cfg);
  check(is(a.lookup(State::FieldStart, '"'),  State::QuoteOpened, Action::NoOp),          "field_start quote opens");
  check(is(a.lookup(State::FieldStart, ','),  State::FieldStart, Action::CommitField),    "field_start delimiter commits empty field");
  check(is(a.lookup(State::FieldStart, '\r'), State::AfterCr, Action::CommitRecord),      "field_start CR commits record");
  check(is(a.lookup(State::FieldStart, 'x'),  State::InUnquotedField, Action::Append),    "field_start other appends");
  check(is(a.lookup(State::AfterCr, '\n'),    State::FieldStart, Action::NoOp),           "after_cr LF completes CRLF");
  check(is(a.lookup(State::AfterCr, '\r'),    State::AfterCr, Action::CommitRecord),      "after_cr CR is an empty record");
  check(is(a.lookup(State::AfterCr, 'x'),     State::FieldStart, Action::Pushback),       "after_cr other pushes back");
  check(is(a.lookup(State::InUnquotedField, '"'), State::SkipToEol, Action::Checkpoint),  "quote inside unquoted field checkpoints");
  check(is(a.lookup(State::InQuotedField, ','),   State::InQuotedField, Action::Append),  "delimiter is literal when quoted");
  check(is(a.lookup(State::InQuotedField, '\n'),  State::InQuotedField, Action::Append),  "LF is literal when quoted");
  check(is(a.lookup(State::AfterClosingQuote, '"'), State::InQuotedField, Action::Append), "doubled quote appends one quote");
  check(is(a.lookup(State::AfterClosingQuote, 'x'), State::SkipToEol, Action::Checkpoint), "text after closing quote checkpoints");
  check(is(a.lookup(State::SkipToEol, '\n'),  State::FieldStart, Action::RaiseError),     "skip_to_eol LF raises");
  check(is(a.lookup(State::SkipToEol, '\r'),  State::SkipToEolAfterCr, Action::NoOp),     "skip_to_eol CR waits for LF");
  check(is(a.lookup(State::SkipToEolAfterCr, 'x'), State::FieldStart, Action::RaiseErrorPushback), "lone CR ends a skipped line");

  check(a.accepting(State::FieldStart) && a.accepting(State::AfterCr) &&
        a.accepting(State::InUnquotedField) && a.accepting(State::AfterClosingQuote), "accepting states");
  check(!a.accepting(State::QuoteOpened) && !a.accepting(State::InQuotedField) &&
        !a.accepting(State::SkipToEol) && !a.accepting(State::SkipToEolAfterCr), "non-accepting states");

  ds::DsvConfig noq; noq.quote = "";
  const ds::Automaton b = ds::build_automaton(noq);
  check(is(b.lookup(State::FieldStart, '"'), State::InUnquotedField, Action::Append), "quote byte is data when quoting is off");
  check(!b.accepting(State::AfterClosingQuote), "after_closing_quote not accepting without quoting");

  ds::DsvConfig strict; strict.quote_required = true;
  const ds::Automaton c = ds::build_automaton(strict);
  check(is(c.lookup(State::FieldStart, 'x'), State::SkipToEol, Action::Checkpoint), "quote_required rejects bare field");
  check(is(c.lookup(State::FieldStart, ','), State::FieldStart, Action::CommitField), "quote_required still allows empty field");

  ds::DsvConfig semi; semi.delimiter = ";";
  const ds::Automaton d = ds::build_automaton(semi);
  check(is(d.lookup(State::FieldStart, ';'), State::FieldStart, Action::CommitField), "custom delimiter commits");
  check(is(d.lookup(State::InUnquotedField, ','), State::InUnquotedField, Action::Append), "comma is data under ';'");

  ds::DsvConfig bad;
  bad = {}; bad.delimiter = "";   check(throws_config(bad), "empty delimiter rejected");
  bad = {}; bad.delimiter = ",,"; check(throws_config(bad), "two-byte delimiter rejected");
  bad = {}; bad.delimiter = "\n"; check(throws_config(bad), "LF delimiter rejected");
  bad = {}; bad.quote = "''";     check(throws_config(bad), "two-byte quote rejected");
  bad = {}; bad.quote = ",";      check(throws_config(bad), "quote equal to delimiter rejected");
  bad = {}; bad.quote = "";       check(!throws_config(bad), "empty quote accepted");

  bool ctor_threw = false;
  bad = {}; bad.delimiter = "\r";
  try { ds::DsvParser rejected(bad); } catch (const ds::ConfigError&) { ctor_threw = true; }
  check(ctor_threw, "parser construction validates the config");

  ds::DsvConfig tab; tab.delimiter = "\t";
  ds::DsvParser p(tab);
  bool reset_threw = false;
  ds::DsvConfig invalid; invalid.delimiter = "ab";
  try { p.reset(invalid); } catch (const ds::ConfigError&) { reset_threw = true; }
  check(reset_threw && p.delimiter() == '\t', "reset with invalid config throws and keeps the old dialect");

  check(std::strcmp(ds::state_name(State::SkipToEolAfterCr), "skip_to_eol_after_cr") == 0, "state names");
  check(std::strcmp(ds::action_name(Action::RaiseErrorPushback), "raise_error_pushback") == 0, "action names");

  if (failures) { std::cerr << failures << " check(s) failed\n"; return 1; }
  return 0;
}
