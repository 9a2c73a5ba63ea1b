#include "cmd_remove.h"

#include "cmd_common.h"
#include "tui.h"
#include "util.h"

#include "CLI11.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace quarry {

void cmd_remove::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("remove", "Drop a dependency and uninstall unused rocks") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("name", cfg_ptr->name, "Dependency name")->required();
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_remove::cmd_remove(cfg cfg, global_options globals)
    : cfg_{ std::move(cfg) }, globals_{ std::move(globals) } {}

void cmd_remove::execute() {
  auto const name{ util_to_lower(cfg_.name) };
  auto s{ session_open(globals_) };
  if (!s->proj->remove_dependency(name)) {
    throw std::runtime_error(name + " is not a dependency in " +
                             s->proj->manifest_path.string());
  }
  tui::info("Removed %s from %s", name.c_str(), s->proj->manifest_path.c_str());

  auto const lock_path{ s->proj->lockfile_path() };
  auto data{ lockfile::load(lock_path) };
  if (!data) { return; }

  // Every remaining root keeps its locked closure, also when its constraint has drifted.
  std::vector<std::string> remaining;
  for (auto const &r : s->proj->roots()) {
    if (!r.is_runtime()) { remaining.push_back(r.name); }
  }
  for (auto const &rock : lockfile::unreachable(*data, remaining)) {
    auto const &entry{ data->rocks.at(rock) };
    s->tree_->remove(rock, entry.version);
    tui::info("  - %s %s", rock.c_str(), entry.version.c_str());
    data->rocks.erase(rock);
  }
  std::erase_if(data->entrypoints,
                [&](std::string const &e) { return !data->rocks.contains(e) || e == name; });
  if (auto const it{ data->rocks.find(name) }; it != data->rocks.end()) {
    it->second.constraint.reset();  // still needed transitively
  }
  lockfile::save(lock_path, *data);
}

}  // namespace quarry
