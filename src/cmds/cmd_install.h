#pragma once

#include "cmd.h"

#include <functional>
#include <string>
#include <vector>

namespace CLI { class App; }

namespace quarry {

class cmd_install : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_install> {
    std::vector<std::string> dependencies;  // extra roots on top of quarry.lua
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_install(cfg cfg, global_options globals);

  void execute() override;

 private:
  cfg cfg_;
  global_options globals_;
};

}  // namespace quarry
