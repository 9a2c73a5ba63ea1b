#include "cmd_path.h"

#include "context.h"
#include "platform.h"
#include "project.h"
#include "shell.h"
#include "tree.h"
#include "tui.h"

#include "CLI11.hpp"

namespace quarry {

void cmd_path::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("path", "Print LUA_PATH, LUA_CPATH and PATH exports") };
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_path::cmd_path(cfg cfg, global_options globals)
    : cfg_{ std::move(cfg) }, globals_{ std::move(globals) } {}

void cmd_path::execute() {
  auto const proj{ project::load(project::find_manifest_path(globals_.manifest_path)) };
  auto const vars{ context_merge_variables(context_default_variables(platform::os_name()),
                                           proj->variables) };
  tree const t{ proj->tree_root(), globals_.lua.value_or(proj->runtime()),
                vars.at("LIB_EXTENSION") };

  // ";;" keeps Lua's default search path after ours.
  tui::print_stdout("export LUA_PATH=%s\n", shell_quote(t.lua_path() + ";;").c_str());
  tui::print_stdout("export LUA_CPATH=%s\n", shell_quote(t.lua_cpath() + ";;").c_str());
  if (auto const bin{ t.bin_path() }; !bin.empty()) {
    tui::print_stdout("export PATH=%s\"$PATH\"\n", shell_quote(bin + ":").c_str());
  }
}

}  // namespace quarry
