#pragma once

#include "cmd.h"

#include <functional>
#include <string>

namespace CLI { class App; }

namespace quarry {

class cmd_remove : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_remove> {
    std::string name;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_remove(cfg cfg, global_options globals);

  void execute() override;

 private:
  cfg cfg_;
  global_options globals_;
};

}  // namespace quarry
