#include "cmd_magic.h"

#include "config.h"
#include "control.h"
#include "tui.h"
#include "util.h"

#include "CLI11.hpp"

#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>

namespace uvk {

void cmd_magic::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("magic", "Run a uvk magic command inside a uvk kernel") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("line", cfg_ptr->line, "Magic line, e.g. %dependencies numpy")->required();
  sub->add_option("--cell", cfg_ptr->cell, "File holding the cell body ('-' for stdin)");
  sub->add_option("--session", cfg_ptr->session_dir, "Session directory of `uvk launch`");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_magic::cmd_magic(cfg cfg, std::optional<std::filesystem::path> const &cli_config_path)
    : cfg_{ std::move(cfg) }, cli_config_path_{ cli_config_path } {}

magic_result cmd_magic::run() const {
  std::optional<std::string> cell;
  if (cfg_.cell) {
    if (*cfg_.cell == "-") {
      cell = std::string{ std::istreambuf_iterator<char>{ std::cin },
                          std::istreambuf_iterator<char>{} };
    } else {
      cell = util_load_text(*cfg_.cell);
    }
  }

  auto client{ cfg_.session_dir ? std::optional<control_client>{ *cfg_.session_dir }
                                : control_client::from_environment() };
  if (!client) {
    return { .ok = false,
             .ename = "NoSession",
             .evalue = "Not running inside a uvk kernel (" + std::string{ kSessionDirEnv } +
                       " is not set)" };
  }

  auto const info{ client->read_session() };
  if (!info) {
    return { .ok = false,
             .ename = "NoSession",
             .evalue = "Cannot read the session state in " + client->dir().string() };
  }
  auto const version{ python_version::parse(info->python_version) };
  if (!version) {
    return { .ok = false,
             .ename = "NoSession",
             .evalue = "Session reports an unusable Python version: " + info->python_version };
  }

  auto const conf{ config::discover(cli_config_path_) };
  magic_context const ctx{
    .interpreter = *version,
    .submit = [&](dependency_request const &request) {
      auto const id{ client->submit(request) };
      tui::debug("Submitted dependency request %s", id.c_str());
      return client->wait_response(id, conf.install_timeout, conf.poll_interval);
    },
  };

  std::optional<std::string_view> cell_view;
  if (cell) { cell_view = *cell; }
  return magic_run(util_join(cfg_.line, " "), cell_view, ctx);
}

int cmd_magic::execute() {
  auto const result{ run() };
  tui::print_stdout("%s\n", magic_result_to_json(result).c_str());
  return result.ok ? 0 : 1;
}

}  // namespace uvk
