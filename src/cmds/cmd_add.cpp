#include "cmd_add.h"

#include "cmd_common.h"

#include "CLI11.hpp"

#include <memory>

namespace quarry {

void cmd_add::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("add", "Add a dependency to quarry.lua and install it") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("dependency", cfg_ptr->dependency, "Dependency, e.g. \"inspect >= 3.1\"")
      ->required();
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_add::cmd_add(cfg cfg, global_options globals)
    : cfg_{ std::move(cfg) }, globals_{ std::move(globals) } {}

void cmd_add::execute() {
  auto const dep{ dependency::parse(cfg_.dependency) };
  auto s{ session_open(globals_) };

  // Resolve and install before touching quarry.lua so a failed add leaves it intact.
  session_install(*s, install_request{ .extra_roots = { dep } });
  s->proj->add_dependency(dep.to_string());
}

}  // namespace quarry
