#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace ds {

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Guess the delimiter from the extension (.csv ',' | .tsv/.tab '\t' | .psv '|').
// Returns false for anything else.
bool delimiter_for_extension(std::string_view path, char& out);

// Slug generation per config: "hashprefix", "basename", or "keypath".
std::string make_slug(std::string_view key, std::string_view mode, int len);

// First `len` hex digits of the SHA-256 of data.
std::string hex_hash_prefix(std::string_view data, int len);

}
