#pragma once

#include "libcurl_util.h"
#include "uri.h"

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace quarry {

// http, https, ftp and file URLs, downloaded with libcurl.
struct fetch_request_url {
  std::string source;
  std::filesystem::path destination;
};

// Local file or directory, copied. Relative sources resolve against file_root.
struct fetch_request_file {
  std::string source;
  std::filesystem::path destination;
  std::optional<std::filesystem::path> file_root;
};

// Git repository checked out at ref (tag, branch or commit); HEAD when ref is empty.
struct fetch_request_git {
  std::string source;
  std::filesystem::path destination;
  std::string ref;
};

using fetch_request = std::variant<fetch_request_url, fetch_request_file, fetch_request_git>;

struct fetch_result {
  uri_scheme scheme;
  std::filesystem::path resolved_source;
  std::filesystem::path resolved_destination;
};

// Picks the request kind for a rockspec source URL.
fetch_request fetch_request_for(std::string const &source,
                                std::filesystem::path const &destination,
                                std::string const &git_ref,
                                std::optional<std::filesystem::path> const &file_root);

fetch_result fetch_single(fetch_request const &request, http_options const &opts = {});

}  // namespace quarry
