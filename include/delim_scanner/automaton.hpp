#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace ds {

struct DsvConfig;

enum class State : std::uint8_t {
  FieldStart,        // ready to begin a field or record
  AfterCr,           // CR seen; an LF here completes a CRLF pair
  InUnquotedField,
  QuoteOpened,
  InQuotedField,     // delimiter, CR and LF are literal here
  AfterClosingQuote, // escape or close?
  SkipToEol,         // discarding a malformed line
  SkipToEolAfterCr,
};

constexpr std::size_t kStateCount = 8;

enum class Action : std::uint8_t {
  Append,
  NoOp,
  Pushback,
  CommitField,
  CommitRecord,
  Checkpoint,
  RaiseError,
  RaiseErrorPushback,
};

struct Rule {
  static constexpr int kAny = -1;

  int    trigger = kAny; // byte value, or kAny for the default rule
  State  next    = State::FieldStart;
  Action action  = Action::NoOp;

  bool is_default() const noexcept { return trigger == kAny; }
};

// Transition table plus accepting states. Every state's rule list ends
// with exactly one default rule, so lookup always succeeds.
class Automaton {
public:
  const Rule& lookup(State s, unsigned char c) const noexcept;
  const std::vector<Rule>& rules(State s) const noexcept { return table_[index(s)]; }
  bool accepting(State s) const noexcept { return accepting_[index(s)]; }

private:
  friend Automaton build_automaton(const DsvConfig& cfg);
  static std::size_t index(State s) noexcept { return static_cast<std::size_t>(s); }

  std::array<std::vector<Rule>, kStateCount> table_;
  std::array<bool, kStateCount> accepting_{};
};

// Assumes cfg has passed validate().
Automaton build_automaton(const DsvConfig& cfg);

const char* state_name(State s) noexcept;
const char* action_name(Action a) noexcept;

}
