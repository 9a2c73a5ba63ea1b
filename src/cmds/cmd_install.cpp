#include "cmd_install.h"

#include "cmd_common.h"

#include "CLI11.hpp"

#include <memory>

namespace quarry {

void cmd_install::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("install", "Install the project's dependencies") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("dependencies",
                  cfg_ptr->dependencies,
                  "Additional dependencies (\"name >= 1.0\") to install");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_install::cmd_install(cfg cfg, global_options globals)
    : cfg_{ std::move(cfg) }, globals_{ std::move(globals) } {}

void cmd_install::execute() {
  install_request req;
  for (auto const &text : cfg_.dependencies) {
    req.extra_roots.push_back(dependency::parse(text));
  }

  auto s{ session_open(globals_) };
  session_install(*s, req);
}

}  // namespace quarry
