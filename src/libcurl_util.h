#pragma once

#include <atomic>
#include <filesystem>
#include <string>
#include <string_view>

namespace quarry {

struct http_options {
  long timeout_s{ 60 };
  std::atomic_bool const *cancel{ nullptr };
};

void libcurl_ensure_initialized();

// Downloads `url` (http, https, ftp or file) to `destination`. On failure the partial
// file is removed and one of not_found, network_error or cancelled is thrown.
std::filesystem::path libcurl_download(std::string_view url,
                                       std::filesystem::path const &destination,
                                       http_options const &opts = {});

// Fetches `url` into memory. Same error contract as libcurl_download.
std::string libcurl_get(std::string_view url, http_options const &opts = {});

// Maps a failed transfer to the quarry error taxonomy and throws it. `curl_code` is a
// CURLcode; `http_status` is 0 when no response was received.
[[noreturn]] void libcurl_throw_transfer_error(int curl_code,
                                               long http_status,
                                               std::string const &url,
                                               std::string const &detail);

}  // namespace quarry
