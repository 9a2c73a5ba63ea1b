#pragma once

#include "cmd.h"
#include "cmds/cmd_add.h"
#include "cmds/cmd_build.h"
#include "cmds/cmd_install.h"
#include "cmds/cmd_lock_update.h"
#include "cmds/cmd_path.h"
#include "cmds/cmd_pin.h"
#include "cmds/cmd_remove.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <optional>
#include <string>
#include <variant>

namespace quarry {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_add::cfg,
                                 cmd_build::cfg,
                                 cmd_install::cfg,
                                 cmd_lock_update::cfg,
                                 cmd_path::cfg,
                                 cmd_pin::cfg,
                                 cmd_remove::cfg,
                                 cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  global_options globals;
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::string cli_output;  // help text or a parse error
};

cli_args cli_parse(int argc, char **argv);

}  // namespace quarry
