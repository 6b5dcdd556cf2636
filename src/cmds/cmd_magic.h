#pragma once

#include "cmd.h"
#include "magic.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace CLI { class App; }

namespace uvk {

// Runs one magic command on behalf of code inside a uvk kernel and prints the result as
// a JSON object on stdout.
class cmd_magic : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_magic> {
    std::vector<std::string> line;              // joined with spaces: "%dependencies numpy"
    std::optional<std::filesystem::path> cell;  // cell body for %% magics; "-" reads stdin
    std::optional<std::filesystem::path> session_dir;  // default: $UVK_SESSION_DIR
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_magic(cfg cfg, std::optional<std::filesystem::path> const &cli_config_path);

  // 0 when the magic succeeded, 1 otherwise.
  int execute() override;

  magic_result run() const;

 private:
  cfg cfg_;
  std::optional<std::filesystem::path> cli_config_path_;
};

}  // namespace uvk
