#include "delim_scanner/automaton.hpp"
#include "delim_scanner/dsv_config.hpp"

namespace ds {

namespace {

constexpr int CR = '\r';
constexpr int LF = '\n';

Rule on(int c, State next, Action a) { return Rule{c, next, a}; }
Rule otherwise(State next, Action a) { return Rule{Rule::kAny, next, a}; }
std::size_t idx(State s) { return static_cast<std::size_t>(s); }

}

const Rule& Automaton::lookup(State s, unsigned char c) const noexcept {
  const auto& rs = table_[index(s)];
  for (std::size_t i = 0; i + 1 < rs.size(); ++i)
    if (rs[i].trigger == c) return rs[i];
  return rs.back();
}

Automaton build_automaton(const DsvConfig& cfg) {
  using S = State;
  using A = Action;

  const int D = static_cast<unsigned char>(cfg.delimiter[0]);
  const bool quoting = !cfg.quote.empty();
  const int Q = quoting ? static_cast<unsigned char>(cfg.quote[0]) : Rule::kAny;
  const bool strict = quoting && cfg.quote_required;

  Automaton a;
  auto& t = a.table_;
  auto at = [&](S s) -> std::vector<Rule>& { return t[idx(s)]; };

  // Quote rules go first so a quote byte never falls through to a default.
  if (quoting) at(S::FieldStart).push_back(on(Q, S::QuoteOpened, A::NoOp));
  at(S::FieldStart).push_back(on(D,  S::FieldStart, A::CommitField));
  at(S::FieldStart).push_back(on(CR, S::AfterCr,    A::CommitRecord));
  at(S::FieldStart).push_back(on(LF, S::FieldStart, A::CommitRecord));
  at(S::FieldStart).push_back(strict ? otherwise(S::SkipToEol, A::Checkpoint)
                                     : otherwise(S::InUnquotedField, A::Append));

  at(S::AfterCr) = {
    on(LF, S::FieldStart, A::NoOp),
    on(CR, S::AfterCr,    A::CommitRecord),
    otherwise(S::FieldStart, A::Pushback),
  };

  at(S::InUnquotedField).push_back(on(D, S::FieldStart, A::CommitField));
  if (quoting) at(S::InUnquotedField).push_back(on(Q, S::SkipToEol, A::Checkpoint));
  at(S::InUnquotedField).push_back(on(CR, S::AfterCr,    A::CommitRecord));
  at(S::InUnquotedField).push_back(on(LF, S::FieldStart, A::CommitRecord));
  at(S::InUnquotedField).push_back(otherwise(S::InUnquotedField, A::Append));

  if (quoting) {
    at(S::QuoteOpened) = {
      on(Q, S::AfterClosingQuote, A::NoOp),
      otherwise(S::InQuotedField, A::Append),
    };
    at(S::InQuotedField) = {
      on(Q, S::AfterClosingQuote, A::NoOp),
      otherwise(S::InQuotedField, A::Append),
    };
    at(S::AfterClosingQuote) = {
      on(D,  S::FieldStart,    A::CommitField),
      on(Q,  S::InQuotedField, A::Append),      // doubled quote
      on(CR, S::AfterCr,       A::CommitRecord),
      on(LF, S::FieldStart,    A::CommitRecord),
      otherwise(S::SkipToEol,  A::Checkpoint),
    };
  } else {
    // Unreachable without a quote byte; keep lookup total.
    at(S::QuoteOpened)       = { otherwise(S::InQuotedField, A::Append) };
    at(S::InQuotedField)     = { otherwise(S::InQuotedField, A::Append) };
    at(S::AfterClosingQuote) = { otherwise(S::SkipToEol, A::Checkpoint) };
  }

  at(S::SkipToEol) = {
    on(CR, S::SkipToEolAfterCr, A::NoOp),
    on(LF, S::FieldStart,       A::RaiseError),
    otherwise(S::SkipToEol, A::NoOp),
  };
  at(S::SkipToEolAfterCr) = {
    on(LF, S::FieldStart, A::RaiseError),
    otherwise(S::FieldStart, A::RaiseErrorPushback),
  };

  a.accepting_[idx(S::FieldStart)]        = true;
  a.accepting_[idx(S::AfterCr)]           = true;
  a.accepting_[idx(S::InUnquotedField)]   = true;
  a.accepting_[idx(S::AfterClosingQuote)] = quoting;
  return a;
}

const char* state_name(State s) noexcept {
  switch (s) {
    case State::FieldStart:        return "field_start";
    case State::AfterCr:           return "after_cr";
    case State::InUnquotedField:   return "in_unquoted_field";
    case State::QuoteOpened:       return "quote_opened";
    case State::InQuotedField:     return "in_quoted_field";
    case State::AfterClosingQuote: return "after_closing_quote";
    case State::SkipToEol:         return "skip_to_eol";
    case State::SkipToEolAfterCr:  return "skip_to_eol_after_cr";
  }
  return "unknown";
}

const char* action_name(Action a) noexcept {
  switch (a) {
    case Action::Append:             return "append";
    case Action::NoOp:               return "noop";
    case Action::Pushback:           return "pushback";
    case Action::CommitField:        return "commit_field";
    case Action::CommitRecord:       return "commit_record";
    case Action::Checkpoint:         return "checkpoint";
    case Action::RaiseError:         return "raise_error";
    case Action::RaiseErrorPushback: return "raise_error_pushback";
  }
  return "unknown";
}

}
