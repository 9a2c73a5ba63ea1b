#include "cmd_pin.h"

#include "lockfile.h"
#include "project.h"
#include "tui.h"
#include "util.h"

#include "CLI11.hpp"

#include <memory>
#include <stdexcept>

namespace quarry {

void cmd_pin::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  for (bool const pinned : { true, false }) {
    auto *sub{ app.add_subcommand(pinned ? "pin" : "unpin",
                                  pinned ? "Keep a rock's locked version on update"
                                         : "Let lock update change a rock's version") };
    auto cfg_ptr{ std::make_shared<cfg>() };
    cfg_ptr->pinned = pinned;
    sub->add_option("name", cfg_ptr->name, "Rock name")->required();
    sub->callback([cfg_ptr, on_selected] { on_selected(*cfg_ptr); });
  }
}

cmd_pin::cmd_pin(cfg cfg, global_options globals)
    : cfg_{ std::move(cfg) }, globals_{ std::move(globals) } {}

void cmd_pin::execute() {
  auto const proj{ project::load(project::find_manifest_path(globals_.manifest_path)) };
  auto const path{ proj->lockfile_path() };
  auto data{ lockfile::load(path) };
  if (!data) {
    throw std::runtime_error(path.string() + " does not exist; run quarry install first");
  }

  auto const name{ util_to_lower(cfg_.name) };
  lockfile::set_pinned(*data, name, cfg_.pinned);
  lockfile::save(path, *data);
  tui::info("%s %s %s",
            cfg_.pinned ? "Pinned" : "Unpinned",
            name.c_str(),
            data->rocks.at(name).version.c_str());
}

}  // namespace quarry
