#pragma once
#include <string>
#include <string_view>
#include "delim_scanner/dsv_config.hpp"

namespace ds {

// Raw field bytes -> UTF-8 text. Applied once per committed field, never per byte,
// so multi-byte sequences split across chunks stay intact.
std::string decode_field(std::string_view raw, Encoding enc);

// UTF-8 text -> bytes in `enc`. Latin-1 output replaces code points above
// U+00FF (and malformed UTF-8) with '?'.
std::string encode_text(std::string_view text, Encoding enc);

constexpr std::string_view kUtf8Bom{"\xEF\xBB\xBF", 3};

}
