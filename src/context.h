#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace quarry {

using variable_map = std::map<std::string, std::string>;

struct network_config {
  int retries{ 3 };
  int backoff_ms{ 250 };
  long timeout_s{ 60 };
};

// Everything a resolve or install run reads, passed explicitly down the call chain.
struct context {
  std::string runtime{ "5.4" };
  std::filesystem::path tree_root;
  std::filesystem::path cache_root;
  std::string server{ "https://luarocks.org" };
  unsigned jobs{ 0 };  // 0 selects the hardware concurrency
  network_config network;
  variable_map variables;  // defaults merged with project and command-line values
  bool allow_prerelease{ false };
  std::string os;  // rockspec platform; empty selects the host
};

// CC, LD, CFLAGS, LIBFLAG, MAKE, CMAKE, LIB_EXTENSION for `os`.
variable_map context_default_variables(std::string_view os);

// Defaults overlaid with `overrides`.
variable_map context_merge_variables(variable_map defaults, variable_map const &overrides);

}  // namespace quarry
