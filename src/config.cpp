#include "config.h"

#include "errors.h"
#include "platform.h"
#include "sol_util.h"
#include "tui.h"
#include "util.h"

#include <stdexcept>
#include <string>

namespace uvk {

namespace {

constexpr std::string_view kContext{ "UVK" };

std::chrono::milliseconds get_duration(sol::table const &table,
                                       std::string_view key,
                                       std::chrono::milliseconds fallback) {
  auto const value{ sol_util_get_optional<double>(table, key, kContext) };
  if (!value) { return fallback; }
  if (*value <= 0) {
    throw std::runtime_error(std::string(kContext) + ": " + std::string(key) +
                             " must be positive");
  }
  return std::chrono::milliseconds{ static_cast<long long>(*value) };
}

}  // namespace

std::optional<mutation_policy> mutation_policy_parse(std::string_view text) {
  if (text == "auto") { return mutation_policy::automatic; }
  if (text == "live") { return mutation_policy::live; }
  if (text == "rebuild") { return mutation_policy::rebuild; }
  return std::nullopt;
}

std::string_view mutation_policy_name(mutation_policy policy) {
  switch (policy) {
    case mutation_policy::automatic: return "auto";
    case mutation_policy::live: return "live";
    case mutation_policy::rebuild: return "rebuild";
  }
  return "unknown";
}

config config::defaults() {
  config c;
  c.scratch_root = platform::get_default_scratch_root();
  return c;
}

config config::load(std::string_view script, std::filesystem::path const &origin) {
  auto state{ sol_util_make_lua_state() };

  if (sol::protected_function_result const result{
          state->safe_script(script, sol::script_pass_on_error) };
      !result.valid()) {
    sol::error err = result;
    throw std::runtime_error("Failed to evaluate config " + origin.string() + ": " +
                             err.what());
  }

  config c{ defaults() };
  c.source = origin;

  sol::object const uvk_obj{ (*state)["UVK"] };
  if (!uvk_obj.valid() || uvk_obj.get_type() == sol::type::lua_nil) { return c; }
  if (uvk_obj.get_type() != sol::type::table) {
    throw std::runtime_error("Config " + origin.string() + ": UVK must be a table");
  }
  sol::table const table{ uvk_obj.as<sol::table>() };

  if (auto const uv{ sol_util_get_optional<std::string>(table, "uv", kContext) }) {
    c.uv = std::filesystem::path{ *uv };
  }
  if (auto const root{ sol_util_get_optional<std::string>(table, "scratch_root", kContext) }) {
    c.scratch_root = std::filesystem::path{ *root };
  }

  c.handshake_timeout = get_duration(table, "handshake_timeout_ms", c.handshake_timeout);
  c.grace_period = get_duration(table, "grace_period_ms", c.grace_period);
  c.install_timeout = get_duration(table, "install_timeout_ms", c.install_timeout);
  c.poll_interval = get_duration(table, "poll_interval_ms", c.poll_interval);

  if (auto const policy{
          sol_util_get_optional<std::string>(table, "mutation_policy", kContext) }) {
    auto const parsed{ mutation_policy_parse(*policy) };
    if (!parsed) {
      throw std::runtime_error("UVK: mutation_policy must be one of auto, live, rebuild (got '" +
                               *policy + "')");
    }
    c.policy = *parsed;
  }

  if (auto packages{ sol_util_get_string_array(table, "base_packages", kContext) }) {
    c.base_packages = std::move(*packages);
  }

  return c;
}

config config::load(std::filesystem::path const &path) {
  tui::debug("Loading config from %s", path.string().c_str());
  return load(util_load_text(path), path);
}

config config::discover(std::optional<std::filesystem::path> const &cli_path) {
  if (cli_path) {
    if (!platform::file_exists(*cli_path)) {
      throw std::runtime_error("config not found: " + cli_path->string());
    }
    return load(*cli_path);
  }

  for (auto const &candidate : platform::get_config_candidates()) {
    if (platform::file_exists(candidate)) { return load(candidate); }
  }

  return defaults();
}

std::filesystem::path config::uv_executable() const {
  auto const found{ platform::find_executable(uv ? uv->string() : "uv") };
  if (!found) {
    throw uvk_error(
        "uv executable cannot be found; it is critical for provisioning kernel "
        "environments");
  }
  return *found;
}

}  // namespace uvk
