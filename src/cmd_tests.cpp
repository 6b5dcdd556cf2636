#include "cmd.h"

#include "doctest.h"

#include <filesystem>
#include <optional>

namespace {

class test_cmd : public uvk::cmd {
 public:
  struct cfg : uvk::cmd_cfg<test_cmd> {
    int exit_code{ 0 };
  };
  test_cmd(cfg c, std::optional<std::filesystem::path> const &cli_config_path)
      : cfg_{ c }, config_path_{ cli_config_path } {}
  int execute() override { return cfg_.exit_code; }

  std::optional<std::filesystem::path> const &config_path() const { return config_path_; }

 private:
  cfg cfg_;
  std::optional<std::filesystem::path> config_path_;
};

}  // namespace

TEST_CASE("cmd_cfg exposes cmd_t alias") {
  using config_type = test_cmd::cfg;
  using expected_command = test_cmd;
  using actual_command = config_type::cmd_t;
  CHECK(std::is_same_v<actual_command, expected_command>);
}

TEST_CASE("cmd factory creates command from cfg") {
  test_cmd::cfg cfg{};
  cfg.exit_code = 7;
  auto cmd{ uvk::cmd::create(cfg, std::filesystem::path{ "/etc/uvk.lua" }) };
  REQUIRE(cmd);
  auto const *typed{ dynamic_cast<test_cmd *>(cmd.get()) };
  REQUIRE(typed);
  CHECK(typed->config_path() == std::filesystem::path{ "/etc/uvk.lua" });
  CHECK(cmd->execute() == 7);
}
