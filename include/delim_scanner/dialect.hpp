#pragma once
#include <string>
#include <string_view>
#include "delim_scanner/dsv_config.hpp"

namespace ds {

// Callback-free parser settings, as read from the CLI, a JSON dialect file
// or HTTP query parameters.
struct Dialect {
  std::string delimiter = ",";
  std::string quote     = "\"";
  bool quote_required   = false;
  Encoding encoding     = Encoding::Utf8;
  bool strip_bom        = false;
  bool report_unterminated = false;
  bool header           = false; // first record names the columns

  // Copies the settings into cfg; callbacks are left alone.
  void apply(DsvConfig& cfg) const;
};

// {"delimiter":";","quote":"'"|""|null,"quote_required":true,
//  "encoding":"latin1","strip_bom":true,"report_unterminated":false,
//  "header":true}. Unknown keys are ignored; absent keys keep their value.
bool parse_dialect(std::string_view json, Dialect& out, std::string* err_out = nullptr);
bool load_dialect(const std::string& path, Dialect& out, std::string* err_out = nullptr);

}
