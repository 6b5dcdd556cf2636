#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace CLI { class App; }

namespace uvk {

// The process a uvk kernelspec starts: provisions a fresh environment, runs the kernel in
// it until the host shuts it down, then removes the environment.
class cmd_launch : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_launch> {
    std::string kernel_name{ "uvk" };
    std::optional<std::string> python;
    std::vector<std::string> with;  // extra dependencies beyond the configured base set
    std::filesystem::path connection_file;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_launch(cfg cfg, std::optional<std::filesystem::path> const &cli_config_path);

  // The kernel's exit status.
  int execute() override;

 private:
  cfg cfg_;
  std::optional<std::filesystem::path> cli_config_path_;
};

// Selector used when the kernelspec names no interpreter: the highest Python 3.
inline constexpr char kAnyPython3[]{ ">=3" };

}  // namespace uvk
