#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace quarry {

enum class uri_scheme {
  HTTP,
  HTTPS,
  FTP,
  GIT,
  SSH,
  LOCAL_FILE_ABSOLUTE,
  LOCAL_FILE_RELATIVE,
  UNKNOWN
};

struct uri_info {
  uri_scheme scheme;
  std::string canonical;  // trimmed input; local paths have file:// stripped
  std::string transport;  // URL handed to curl/libgit2 ("git+https://x" -> "https://x")
};

uri_info uri_classify(std::string_view value);

bool uri_is_remote(uri_scheme scheme);

std::filesystem::path uri_resolve_local_file_relative(
    std::string_view local_file,
    std::optional<std::filesystem::path> const &anchor);

// Last path component of a URI, without query or fragment. Empty if there is none.
std::string uri_extract_filename(std::string_view uri);

// Joins a base URL or directory with a relative file name using exactly one '/'.
std::string uri_join(std::string_view base, std::string_view name);

}  // namespace quarry
