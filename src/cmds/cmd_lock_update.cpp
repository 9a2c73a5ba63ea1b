#include "cmd_lock_update.h"

#include "cmd_common.h"
#include "util.h"

#include "CLI11.hpp"

#include <memory>

namespace quarry {

void cmd_lock_update::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *lock{ app.add_subcommand("lock", "Lockfile maintenance") };
  lock->require_subcommand(1);

  auto *sub{ lock->add_subcommand("update", "Re-resolve and rewrite the lockfile") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("names", cfg_ptr->names, "Rocks to update (all unpinned if omitted)");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_lock_update::cmd_lock_update(cfg cfg, global_options globals)
    : cfg_{ std::move(cfg) }, globals_{ std::move(globals) } {}

void cmd_lock_update::execute() {
  install_request req;
  if (cfg_.names.empty()) {
    req.unlock_all = true;
  } else {
    for (auto const &name : cfg_.names) { req.unlocked.insert(util_to_lower(name)); }
  }

  auto s{ session_open(globals_) };
  session_install(*s, req);
}

}  // namespace quarry
