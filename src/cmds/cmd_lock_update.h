#pragma once

#include "cmd.h"

#include <functional>
#include <string>
#include <vector>

namespace CLI { class App; }

namespace quarry {

class cmd_lock_update : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_lock_update> {
    std::vector<std::string> names;  // empty: every unpinned rock
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_lock_update(cfg cfg, global_options globals);

  void execute() override;

 private:
  cfg cfg_;
  global_options globals_;
};

}  // namespace quarry
