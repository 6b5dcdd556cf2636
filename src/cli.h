#pragma once

#include "cmds/cmd_install.h"
#include "cmds/cmd_launch.h"
#include "cmds/cmd_list.h"
#include "cmds/cmd_magic.h"
#include "cmds/cmd_uninstall.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace uvk {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_install::cfg,
                                 cmd_launch::cfg,
                                 cmd_list::cfg,
                                 cmd_magic::cfg,
                                 cmd_uninstall::cfg,
                                 cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  std::optional<std::filesystem::path> config_path;  // Global --config override
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::vector<tui::trace_output_spec> trace_outputs;
  std::string cli_output;
};

// -q lowers verbosity one step per repetition (WARN, ERROR); --debug raises it to DEBUG.
tui::level cli_verbosity(int quiet, bool debug);

cli_args cli_parse(int argc, char **argv);

}  // namespace uvk
