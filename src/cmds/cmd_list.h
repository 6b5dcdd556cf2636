#pragma once

#include "cmd.h"
#include "cmd_common.h"
#include "kernelspec.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <vector>

namespace CLI { class App; }

namespace uvk {

class cmd_list : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_list> {
    data_dir_selection data_dir;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_list(cfg cfg, std::optional<std::filesystem::path> const &cli_config_path);

  int execute() override;

 private:
  cfg cfg_;
};

// `kernels` directories in lookup order: each $JUPYTER_PATH entry, then the selected
// data directory.
std::vector<std::filesystem::path> cmd_list_search_dirs(data_dir_selection const &sel);

// Specs across `kernels_dirs`; when a name appears more than once the first one wins.
std::vector<kernel_spec> cmd_list_collect(std::vector<std::filesystem::path> const &kernels_dirs);

}  // namespace uvk
