#pragma once

#include "cmd.h"

#include <functional>

namespace CLI { class App; }

namespace quarry {

// Prints shell exports of LUA_PATH, LUA_CPATH and PATH for the project tree.
class cmd_path : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_path> {};

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_path(cfg cfg, global_options globals);

  void execute() override;

 private:
  cfg cfg_;
  global_options globals_;
};

}  // namespace quarry
