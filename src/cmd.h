#pragma once

#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>

namespace uvk {

class cmd : unmovable {
 public:
  using ptr_t = std::unique_ptr<cmd>;

  virtual ~cmd() = default;

  // Returns the process exit code.
  virtual int execute() = 0;

  // Create command with the global --config override (for commands that read config)
  template <typename config>
  static ptr_t create(config const &cfg,
                      std::optional<std::filesystem::path> const &cli_config_path);

 protected:
  cmd() = default;
};

// Command configs inherit from this for factory creation.
template <typename command>
struct cmd_cfg {
  using cmd_t = command;
};

template <typename config>
cmd::ptr_t cmd::create(config const &cfg,
                       std::optional<std::filesystem::path> const &cli_config_path) {
  return std::make_unique<typename config::cmd_t>(cfg, cli_config_path);
}

}  // namespace uvk
