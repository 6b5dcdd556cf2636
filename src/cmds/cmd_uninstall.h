#pragma once

#include "cmd.h"
#include "cmd_common.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace uvk {

class cmd_uninstall : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_uninstall> {
    std::string name;
    data_dir_selection data_dir;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_uninstall(cfg cfg, std::optional<std::filesystem::path> const &cli_config_path);

  // 1 when no kernelspec of that name is installed in the selected directory.
  int execute() override;

 private:
  cfg cfg_;
};

}  // namespace uvk
