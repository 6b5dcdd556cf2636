#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace uvk {

enum class mutation_policy { automatic, live, rebuild };

std::optional<mutation_policy> mutation_policy_parse(std::string_view text);
std::string_view mutation_policy_name(mutation_policy policy);

// Runtime settings, from the optional Lua file defining a global `UVK` table.
struct config {
  std::optional<std::filesystem::path> uv;  // nullopt: look up "uv" on PATH
  std::filesystem::path scratch_root;
  std::chrono::milliseconds handshake_timeout{ 30000 };
  std::chrono::milliseconds grace_period{ 5000 };
  std::chrono::milliseconds install_timeout{ 600000 };
  std::chrono::milliseconds poll_interval{ 100 };
  mutation_policy policy{ mutation_policy::automatic };
  std::vector<std::string> base_packages{ "ipykernel" };
  std::optional<std::filesystem::path> source;

  static config defaults();

  // Evaluates `script` and applies the `UVK` table over the defaults. Throws
  // std::runtime_error on a Lua error or a wrongly-typed key.
  static config load(std::string_view script, std::filesystem::path const &origin);
  static config load(std::filesystem::path const &path);

  // Explicit path (must exist), else the first existing platform candidate, else defaults.
  static config discover(std::optional<std::filesystem::path> const &cli_path);

  // Throws uvk_error when uv is neither configured nor on PATH.
  std::filesystem::path uv_executable() const;
};

}  // namespace uvk
