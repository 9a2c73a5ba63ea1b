#include "cli.h"
#include "cmds/cmd_common.h"
#include "libgit2_util.h"
#include "termination.h"
#include "tui.h"

#include <cstdlib>
#include <variant>

int main(int argc, char **argv) {
  quarry::tui::init();
  quarry::termination_handler_install();

  auto args{ quarry::cli_parse(argc, argv) };
  quarry::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  quarry::libgit2_scope git_guard;

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      quarry::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    quarry::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  auto cmd{ std::visit([&](auto const &cfg) { return quarry::cmd::create(cfg, args.globals); },
                       *args.cmd_cfg) };

  try {
    cmd->execute();
  } catch (quarry::install_failed const &ex) {
    for (auto const &f : ex.report().failures) {
      quarry::tui::error("%s@%s: %s: %s",
                         f.name.c_str(),
                         f.version.c_str(),
                         f.kind_name.c_str(),
                         f.message.c_str());
    }
    quarry::tui::error("%s", ex.what());
    return static_cast<int>(ex.status());
  } catch (std::exception const &ex) {
    quarry::tui::error("%s", ex.what());
    return static_cast<int>(quarry::exit_status_for(ex));
  }

  return EXIT_SUCCESS;
}
