#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace rr {

enum class FileFormat { CSV, TSV, Unknown };

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Guess format from extension (.csv | .tsv | .tab).
FileFormat detect_format(std::string_view path);

// Delimiter that goes with a detected format (',' for CSV and Unknown).
char default_delimiter(FileFormat fmt) noexcept;

// Slug generation per mode: "hashprefix", "basename", or "keypath".
std::string make_slug(std::string_view key, std::string_view mode, int len);

// First `len` hex digits of SHA-256(data).
std::string hex_hash_prefix(std::string_view data, int len);

}
