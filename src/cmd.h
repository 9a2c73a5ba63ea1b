#pragma once

#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace quarry {

// Options accepted before the subcommand; they override quarry.lua and the environment.
struct global_options {
  std::optional<std::filesystem::path> cache_root;
  std::optional<std::filesystem::path> manifest_path;
  std::optional<unsigned> jobs;
  std::optional<std::string> server;
  std::optional<std::string> lua;
};

class cmd : unmovable {
 public:
  using ptr_t = std::unique_ptr<cmd>;

  virtual ~cmd() = default;
  virtual void execute() = 0;

  template <typename config>
  static ptr_t create(config const &cfg, global_options const &globals);

 protected:
  cmd() = default;
};

// Command configs inherit from this for factory creation.
template <typename command>
struct cmd_cfg {
  using cmd_t = command;
};

template <typename config>
cmd::ptr_t cmd::create(config const &cfg, global_options const &globals) {
  return std::make_unique<typename config::cmd_t>(cfg, globals);
}

}  // namespace quarry
