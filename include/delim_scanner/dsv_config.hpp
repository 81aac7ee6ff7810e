#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace ds {

enum class State : std::uint8_t;

// Declared encoding of the input bytes. Utf8 passes bytes through;
// Latin1 fields are transcoded to UTF-8 when committed.
enum class Encoding { Utf8, Latin1 };

// Invalid delimiter/quote settings. Thrown at construction or reset.
class ConfigError : public std::invalid_argument {
public:
  explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

// A record that cannot be represented in the configured dialect.
class SerializeError : public std::runtime_error {
public:
  explicit SerializeError(const std::string& what) : std::runtime_error(what) {}
};

struct ErrorInfo {
  std::string   input;      // malformed line, terminator excluded
  std::string   span;       // from the checkpoint to the end of the line
  std::uint64_t line   = 0;
  std::uint64_t column = 0; // column of the checkpoint
  State         state{};    // state in which the anomaly was detected
  std::uint64_t offset = 0; // absolute byte offset of the checkpoint
};

using Record         = std::vector<std::string>;
using ErrorCallback  = std::function<void(const ErrorInfo&)>;
using FieldCallback  = std::function<void(std::string_view field, std::size_t index, std::uint64_t line)>;
using RecordCallback = std::function<std::string(const Record& record, std::uint64_t line)>;

struct DsvConfig {
  std::string delimiter = ",";
  std::string quote     = "\"";   // empty disables quoting
  bool quote_required   = false;  // every field must open with `quote`
  Encoding encoding     = Encoding::Utf8;
  bool strip_bom        = false;  // UTF-8 BOM at the start of the stream
  bool report_unterminated = false;
  // Bytes of a line kept for ErrorInfo::input/span (0 = whole line).
  // Longer lines are reported by their first max_error_input bytes.
  std::size_t max_error_input = 1u << 20;

  ErrorCallback  on_error;
  FieldCallback  on_header_field;
  FieldCallback  on_field;
  RecordCallback on_header;
  RecordCallback on_record;
};

// Throws ConfigError describing the first invalid setting.
void validate(const DsvConfig& cfg);

// "utf-8" | "utf8" | "latin1" | "iso-8859-1" (case-insensitive).
bool parse_encoding(std::string_view name, Encoding& out);
const char* encoding_name(Encoding e) noexcept;

}
