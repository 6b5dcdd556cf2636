#pragma once

#include "cmd.h"
#include "cmd_common.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace CLI { class App; }

namespace uvk {

class cmd_install : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_install> {
    std::string name{ "uvk" };
    std::optional<std::string> display_name;  // default derived from `python`
    data_dir_selection data_dir;
    std::vector<std::pair<std::string, std::string>> env;  // --env and --tmp, in order
    std::optional<std::string> python;
    std::optional<std::filesystem::path> icon;
    std::optional<std::filesystem::path> launcher;  // default: this executable
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_install(cfg cfg, std::optional<std::filesystem::path> const &cli_config_path);

  int execute() override;

 private:
  cfg cfg_;
};

}  // namespace uvk
