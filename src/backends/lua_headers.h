#pragma once

#include "context.h"

#include <atomic>
#include <filesystem>
#include <optional>
#include <string>

namespace quarry {

class cache;

struct lua_headers {
  std::filesystem::path incdir;  // holds lua.h
  std::string origin;            // where it was found, for logs
};

// LUA_INCDIR, pkg-config, standard prefixes, then a header set downloaded into the
// cache from LUA_HEADERS_URL. The header's version must match `runtime`. Throws
// header_not_found, or integrity_violation when the download fails its digest.
lua_headers lua_headers_find(std::string const &runtime,
                             variable_map const &vars,
                             cache *header_cache,
                             std::atomic_bool const *cancel = nullptr);

// "5.4" from LUA_VERSION_MAJOR/MINOR (or LUA_VERSION in 5.1) of a lua.h.
std::optional<std::string> lua_headers_version(std::filesystem::path const &lua_h);

// Official source tarball for a runtime, e.g. lua-5.4.7.tar.gz.
std::string lua_headers_default_url(std::string const &runtime);

// SRI a downloaded header tarball must match: LUA_HEADERS_HASH when set, else the pinned
// digest of the default tarball. std::nullopt for other URLs. Throws parse_error on a
// malformed LUA_HEADERS_HASH.
std::optional<std::string> lua_headers_expected_hash(std::string const &runtime,
                                                     std::string const &url,
                                                     variable_map const &vars);

}  // namespace quarry
