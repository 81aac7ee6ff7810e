#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ds {

// A simple bool policy
struct BoolPolicy {
  std::vector<std::string> true_tokens  = {"true","TRUE","True"};
  std::vector<std::string> false_tokens = {"false","FALSE","False"};
  bool case_sensitive = false;
};

// Value inference for typed output of textual fields.
struct ParsePolicy {
  enum class Kind { Null, Bool, Number, String };

  BoolPolicy bools;
  std::vector<std::string> null_tokens = {"", "null", "NULL", "NA"};

  // Numeric parse (fast_float in .cpp); the whole field must match.
  std::optional<double> parse_number(std::string_view s) const;

  // Boolean parse from the configured token sets.
  std::optional<bool> parse_bool(std::string_view s) const;

  bool is_null_token(std::string_view s) const;

  // Null, then bool, then finite number; anything else is a string.
  Kind classify(std::string_view s) const;
};

}
