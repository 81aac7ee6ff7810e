#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "delim_scanner/automaton.hpp"
#include "delim_scanner/dsv_config.hpp"

namespace ds {

// Start of an ambiguous span, kept until the error it leads to is raised.
struct Checkpoint {
  State         state  = State::FieldStart;
  std::uint64_t column = 0;
  std::uint64_t offset = 0; // absolute byte index
};

// Streaming delimited-text parser. Bytes are fed in arbitrary chunks; fields
// and records are delivered through the configured callbacks as soon as they
// complete. Malformed lines are reported through on_error and skipped.
//
// Not thread-safe; use one instance per stream.
class DsvParser {
public:
  DsvParser();                         // default dialect, default callbacks
  explicit DsvParser(DsvConfig cfg);   // throws ConfigError
  DsvParser(DsvParser&& other) noexcept;
  DsvParser& operator=(DsvParser&& other) noexcept;
  DsvParser(const DsvParser&) = delete;
  DsvParser& operator=(const DsvParser&) = delete;
  ~DsvParser();

  static DsvParser create(DsvConfig cfg) { return DsvParser(std::move(cfg)); }

  // Clears the session. With a config, rebuilds the automaton first (throws
  // ConfigError and leaves the parser untouched if the config is invalid).
  void reset();
  void reset(DsvConfig cfg);

  // Scans one chunk. Returns the text produced by record callbacks during
  // this call (also available through parsed()).
  const std::string& feed(std::string_view chunk);

  // Ends the stream. Flushes a trailing record with no line break and
  // returns true if the automaton is in an accepting state; otherwise drops
  // the dangling field/record and returns false.
  bool finish();

  // Renders one record as delimited text, no line terminator.
  std::string serialize(const Record& record) const;

  char delimiter() const noexcept;
  std::optional<char> quote() const noexcept;
  bool quote_required() const noexcept;
  Encoding encoding() const noexcept;

  std::uint64_t line() const noexcept;
  std::uint64_t column() const noexcept;
  const std::string& field() const noexcept;   // raw bytes of the field in progress
  const Record& record() const noexcept;
  State state() const noexcept;
  bool accepting() const noexcept;
  const std::optional<Checkpoint>& checkpoint() const noexcept;
  const Record& header() const noexcept;
  const std::string& parsed() const noexcept;
  // Excludes leading bytes still held as a possible BOM (strip_bom).
  std::uint64_t bytes_consumed() const noexcept;
  const Automaton& automaton() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
