#include "cmd_version.h"

#include "platform.h"
#include "process.h"
#include "util.h"

#include "CLI11.hpp"
#include "semver.hpp"
#include "sol/sol.hpp"
#include "tbb/version.h"
#include "tui.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

#ifndef UVK_VERSION_STR
#error "UVK_VERSION_STR must be defined by the build system"
#endif

namespace uvk {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_version::cmd_version(cmd_version::cfg cfg,
                         std::optional<std::filesystem::path> const & /*cli_config_path*/)
    : cfg_{ std::move(cfg) } {}

int cmd_version::execute() {
  tui::info("uvk version %s (%s)", UVK_VERSION_STR, platform::get_exe_path().string().c_str());

  if (auto const uv{ platform::find_executable("uv") }) {
    auto const r{ process_run({ uv->string(), "--version" },
                              { .timeout = std::chrono::seconds{ 10 } }) };
    if (r.ok()) {
      tui::info("%s (%s)", std::string{ util_trim(r.output) }.c_str(), uv->string().c_str());
    } else {
      tui::warn("%s --version failed (exit %d)", uv->string().c_str(), r.exit_code);
    }
  } else {
    tui::warn("uv executable cannot be found on PATH");
  }

  tui::info("");
  tui::info("Third-party component versions:");
  tui::info("  oneTBB: %s", TBB_VERSION_STRING);
  tui::info("  Lua: %s", LUA_RELEASE);
  tui::info("  Sol2: %s", SOL_VERSION_STRING);
  tui::info("  nlohmann_json: %d.%d.%d",
            NLOHMANN_JSON_VERSION_MAJOR,
            NLOHMANN_JSON_VERSION_MINOR,
            NLOHMANN_JSON_VERSION_PATCH);
  tui::info("  Semver: %d.%d.%d",
            SEMVER_VERSION_MAJOR,
            SEMVER_VERSION_MINOR,
            SEMVER_VERSION_PATCH);
  tui::info("  CLI11: %s", CLI11_VERSION);
  return 0;
}

}  // namespace uvk
