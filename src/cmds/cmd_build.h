#pragma once

#include "cmd.h"

#include <functional>

namespace CLI { class App; }

namespace quarry {

// Resolves from scratch (keeping only pinned versions) and installs.
class cmd_build : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_build> {};

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_build(cfg cfg, global_options globals);

  void execute() override;

 private:
  cfg cfg_;
  global_options globals_;
};

}  // namespace quarry
