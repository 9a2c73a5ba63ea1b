#pragma once

#include "cmd.h"

#include <functional>
#include <string>

namespace CLI { class App; }

namespace quarry {

class cmd_add : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_add> {
    std::string dependency;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_add(cfg cfg, global_options globals);

  void execute() override;

 private:
  cfg cfg_;
  global_options globals_;
};

}  // namespace quarry
