#include "cli.h"

#include "CLI11.hpp"

#include <string>

namespace quarry {

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "quarry - Lua package manager" };
  app.require_subcommand(0, 1);

  cli_args args{};

  bool verbose{ false };
  bool quiet{ false };
  app.add_flag("--verbose",
               verbose,
               "Debug logging, each line prefixed with timestamp and level");
  app.add_flag("-q,--quiet", quiet, "Only print warnings and errors");

  bool version_flag{ false };
  app.add_flag("-v,--version", version_flag, "Show version information");

  app.add_option("--cache-root", args.globals.cache_root, "Cache root directory");
  app.add_option("--manifest", args.globals.manifest_path, "Path to quarry.lua");
  app.add_option("-j,--jobs", args.globals.jobs, "Parallel build jobs")
      ->check(CLI::PositiveNumber);
  app.add_option("--server", args.globals.server, "Rock registry URL or directory");
  app.add_option("--lua", args.globals.lua, "Lua runtime version, e.g. 5.4");

  std::optional<cli_args::cmd_cfg_t> cmd_cfg;
  auto on_selected = [&cmd_cfg](auto cfg) { cmd_cfg = std::move(cfg); };

  cmd_install::register_cli(app, on_selected);
  cmd_add::register_cli(app, on_selected);
  cmd_build::register_cli(app, on_selected);
  cmd_lock_update::register_cli(app, on_selected);
  cmd_pin::register_cli(app, on_selected);
  cmd_remove::register_cli(app, on_selected);
  cmd_path::register_cli(app, on_selected);
  cmd_version::register_cli(app, on_selected);

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
  } catch (CLI::ParseError const &e) { args.cli_output = std::string(e.what()); }

  if (verbose) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = true;
  } else if (quiet) {
    args.verbosity = tui::level::TUI_WARN;
  } else {
    args.verbosity = tui::level::TUI_INFO;
  }

  if (version_flag) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  if (!args.cli_output.empty()) { return args; }

  if (cmd_cfg) {
    args.cmd_cfg = *cmd_cfg;
  } else {
    args.cli_output = app.help();
  }
  return args;
}

}  // namespace quarry
