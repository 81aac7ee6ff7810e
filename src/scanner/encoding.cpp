#include "delim_scanner/encoding.hpp"
#include <cctype>
#include <cstdint>

namespace ds {

std::string decode_field(std::string_view raw, Encoding enc) {
  if (enc == Encoding::Utf8) return std::string(raw);
  std::string out;
  out.reserve(raw.size() + raw.size() / 4);
  for (unsigned char c : raw) {
    if (c < 0x80) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back(static_cast<char>(0xC0 | (c >> 6)));
      out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    }
  }
  return out;
}

std::string encode_text(std::string_view text, Encoding enc) {
  if (enc == Encoding::Utf8) return std::string(text);
  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    const unsigned char c = static_cast<unsigned char>(text[i]);
    if (c < 0x80) { out.push_back(static_cast<char>(c)); ++i; continue; }

    std::size_t len = (c >> 5) == 0x6 ? 2 : (c >> 4) == 0xE ? 3 : (c >> 3) == 0x1E ? 4 : 0;
    if (len == 0 || i + len > text.size()) { out.push_back('?'); ++i; continue; }

    std::uint32_t cp = c & (0xFF >> (len + 1));
    bool ok = true;
    for (std::size_t k = 1; k < len; ++k) {
      const unsigned char cc = static_cast<unsigned char>(text[i + k]);
      if ((cc & 0xC0) != 0x80) { ok = false; break; }
      cp = (cp << 6) | (cc & 0x3F);
    }
    if (!ok) { out.push_back('?'); ++i; continue; }
    out.push_back(cp <= 0xFF ? static_cast<char>(cp) : '?');
    i += len;
  }
  return out;
}

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
  return true;
}

bool parse_encoding(std::string_view name, Encoding& out) {
  if (ieq(name, "utf-8") || ieq(name, "utf8")) { out = Encoding::Utf8; return true; }
  if (ieq(name, "latin1") || ieq(name, "latin-1") || ieq(name, "iso-8859-1")) {
    out = Encoding::Latin1; return true;
  }
  return false;
}

const char* encoding_name(Encoding e) noexcept {
  return e == Encoding::Latin1 ? "latin1" : "utf-8";
}

}
