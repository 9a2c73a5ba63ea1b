#pragma once

#include "cmd.h"

#include <functional>
#include <string>

namespace CLI { class App; }

namespace quarry {

// `pin` and `unpin`: toggles a lockfile entry's pinned flag.
class cmd_pin : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_pin> {
    std::string name;
    bool pinned{ true };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_pin(cfg cfg, global_options globals);

  void execute() override;

 private:
  cfg cfg_;
  global_options globals_;
};

}  // namespace quarry
