#include "cmd_build.h"

#include "cmd_common.h"

#include "CLI11.hpp"

namespace quarry {

void cmd_build::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("build",
                                "Resolve ignoring unpinned lockfile versions and install") };
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_build::cmd_build(cfg cfg, global_options globals)
    : cfg_{ std::move(cfg) }, globals_{ std::move(globals) } {}

void cmd_build::execute() {
  auto s{ session_open(globals_) };
  session_install(*s, install_request{ .unlock_all = true });
}

}  // namespace quarry
