#pragma once

#include "sha256.h"

#include <filesystem>
#include <string>
#include <string_view>

// Subresource-integrity strings ("sha256-<base64>") for rockspecs and sources.
namespace quarry::integrity {

std::string from_digest(sha256_t const &digest);

std::string of_bytes(std::string_view bytes);
std::string of_file(std::filesystem::path const &file);

// A file hashes its bytes. A directory hashes a canonical stream: sorted relative paths,
// each followed by '\0' and the file's bytes. ".git" directories are skipped.
std::string of_path(std::filesystem::path const &path);

// Accepts "sha256-<base64>" or 64 hex digits; returns the SRI form. Throws parse_error.
std::string normalize(std::string_view text);

// Throws integrity_violation when the normalized forms differ.
void verify(std::string_view expected, std::string_view actual, std::string const &subject);

}  // namespace quarry::integrity
