#include "delim_scanner/path_utils.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>
#include <openssl/sha.h>

namespace ds {

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

bool delimiter_for_extension(std::string_view path, char& out) {
  auto ext = std::filesystem::path(std::string(path)).extension().string();
  for (auto& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (ext == ".csv") { out = ','; return true; }
  if (ext == ".tsv" || ext == ".tab") { out = '\t'; return true; }
  if (ext == ".psv") { out = '|'; return true; }
  return false;
}

std::string hex_hash_prefix(std::string_view data, int len) {
  unsigned char md[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), md);
  std::ostringstream o;
  for (int i = 0; i < (len+1)/2 && i < SHA256_DIGEST_LENGTH; ++i)
    o << std::hex << std::setw(2) << std::setfill('0') << (int)md[i];
  auto s = o.str();
  if ((int)s.size() > len) s.resize(len);
  return s;
}

std::string make_slug(std::string_view key, std::string_view mode, int len) {
  if (mode == "basename") {
    auto base = std::filesystem::path(std::string(key)).filename().string();
    if ((int)base.size() > len) base.resize(len);
    return base;
  }
  if (mode == "keypath") {
    auto s = std::string(key);
    for (auto& c : s) if (c=='/' || c=='\\') c='-';
    if ((int)s.size() > len) s.resize(len);
    return s;
  }
  // default: hashprefix
  return hex_hash_prefix(key, len);
}

}
