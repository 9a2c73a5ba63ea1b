#pragma once

#include "context.h"
#include "rockspec.h"

#include <atomic>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace quarry {

struct external_dep_location {
  std::filesystem::path prefix;
  std::filesystem::path incdir;
  std::filesystem::path libdir;
};

// pkg-config, then NAME_DIR / NAME_INCDIR / NAME_LIBDIR variables, then the standard
// prefixes plus EXTERNAL_DEPS_DIRS. Throws external_dependency_not_found.
external_dep_location external_deps_locate(external_dependency const &dep,
                                          variable_map const &vars,
                                          std::atomic_bool const *cancel = nullptr);

// Probes every dependency and returns NAME_DIR, NAME_INCDIR and NAME_LIBDIR for each.
variable_map external_deps_resolve(
    std::map<std::string, external_dependency> const &deps,
    variable_map const &vars,
    std::atomic_bool const *cancel = nullptr);

// Captured stdout of `pkg-config args...`, or nullopt when pkg-config is absent or fails.
std::optional<std::string> external_deps_pkg_config(std::vector<std::string> const &args,
                                                    std::atomic_bool const *cancel);

// "-I/a -I/b" -> {"/a", "/b"} for the given flag prefix.
std::vector<std::string> external_deps_flag_values(std::string const &flags,
                                                   std::string const &prefix);

}  // namespace quarry
