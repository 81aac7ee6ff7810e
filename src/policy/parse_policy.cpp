#include "delim_scanner/parse_policy.hpp"
#include <cctype>
#include <cmath>
#include <string_view>
#include <fast_float/fast_float.h>

namespace ds {

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

std::optional<double> ParsePolicy::parse_number(std::string_view s) const {
  if (s.empty()) return std::nullopt;
  double out;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

std::optional<bool> ParsePolicy::parse_bool(std::string_view s) const {
  for (const auto& t : bools.true_tokens) {
    if (bools.case_sensitive ? (s == t) : ieq(s, t)) return true;
  }
  for (const auto& f : bools.false_tokens) {
    if (bools.case_sensitive ? (s == f) : ieq(s, f)) return false;
  }
  return std::nullopt;
}

bool ParsePolicy::is_null_token(std::string_view s) const {
  for (const auto& n : null_tokens) if (s == n) return true;
  return false;
}

ParsePolicy::Kind ParsePolicy::classify(std::string_view s) const {
  if (is_null_token(s)) return Kind::Null;
  if (parse_bool(s)) return Kind::Bool;
  auto d = parse_number(s);
  if (d && std::isfinite(*d)) return Kind::Number;
  return Kind::String;
}

}
