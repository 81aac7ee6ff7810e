#include "delim_scanner/dsv_config.hpp"

namespace ds {

static bool is_line_break(char c) { return c == '\r' || c == '\n'; }

void validate(const DsvConfig& cfg) {
  if (cfg.delimiter.size() != 1)
    throw ConfigError("delimiter must be exactly one byte (default is ',')");
  if (cfg.quote.size() > 1)
    throw ConfigError("quote must be empty or exactly one byte (default is '\"')");
  if (is_line_break(cfg.delimiter[0]))
    throw ConfigError("delimiter cannot be CR or LF");
  if (!cfg.quote.empty()) {
    if (is_line_break(cfg.quote[0])) throw ConfigError("quote cannot be CR or LF");
    if (cfg.quote[0] == cfg.delimiter[0]) throw ConfigError("quote and delimiter must differ");
  }
}

}
