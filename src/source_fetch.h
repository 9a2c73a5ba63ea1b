#pragma once

#include "cache.h"
#include "libcurl_util.h"
#include "rockspec.h"

#include <atomic>
#include <filesystem>
#include <optional>
#include <string>

namespace quarry {

struct source_fetch_options {
  std::optional<std::filesystem::path> file_root;  // anchors relative local sources
  http_options http;
};

struct fetched_source {
  std::filesystem::path artifact;  // file or directory inside the cache entry
  std::string integrity;           // SRI of the artifact as it is on disk now
};

// Fetches the descriptor's source into the cache, once per source location and ref
// across threads and processes. The artifact is re-hashed on every call so a damaged
// cache entry is caught; a declared source.hash is verified here.
fetched_source source_fetch(cache &c,
                            package_descriptor const &d,
                            source_fetch_options const &opts = {});

// Unpacks (or copies) a fetched artifact into `work_dir` and returns the source root,
// honouring source.dir.
std::filesystem::path source_unpack(fetched_source const &fetched,
                                    package_descriptor const &d,
                                    std::filesystem::path const &work_dir,
                                    std::atomic_bool const *cancel = nullptr);

}  // namespace quarry
