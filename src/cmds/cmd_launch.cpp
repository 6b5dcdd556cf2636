#include "cmd_launch.h"

#include "config.h"
#include "interpreter.h"
#include "provisioner.h"
#include "session.h"
#include "termination.h"
#include "tui.h"
#include "uv.h"

#include "CLI11.hpp"

#include <memory>
#include <stop_token>
#include <thread>

namespace uvk {

void cmd_launch::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("launch",
                                "Provision an environment and run a kernel in it (started "
                                "by Jupyter from the kernelspec)") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--kernel-name", cfg_ptr->kernel_name, "Kernelspec name, for diagnostics")
      ->capture_default_str();
  sub->add_option("--python", cfg_ptr->python, "Interpreter selector");
  sub->add_option("--with", cfg_ptr->with, "Extra dependency (repeatable)");
  sub->add_option("-f,--connection-file", cfg_ptr->connection_file, "Jupyter connection file")
      ->required();
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_launch::cmd_launch(cfg cfg, std::optional<std::filesystem::path> const &cli_config_path)
    : cfg_{ std::move(cfg) }, cli_config_path_{ cli_config_path } {}

int cmd_launch::execute() {
  auto const conf{ config::discover(cli_config_path_) };
  auto const uv{ conf.uv_executable() };

  termination_handler_install();

  uv_env_builder builder{ uv };
  uv_interpreter_source interpreters{ uv, conf.install_timeout };
  provisioner prov{ builder, conf.scratch_root, conf.install_timeout };

  session_params params{ .kernel_name = cfg_.kernel_name,
                         .python = cfg_.python ? interpreter_selector_parse(*cfg_.python)
                                               : version_constraint{ kAnyPython3 },
                         .dependencies = conf.base_packages,
                         .connection_file = cfg_.connection_file };
  params.dependencies.insert(params.dependencies.end(), cfg_.with.begin(), cfg_.with.end());

  // Signal handlers only record; this thread turns a recorded SIGTERM/SIGHUP into a stop
  // request for the session.
  std::stop_source stop;
  std::jthread watcher{ [&stop, poll = conf.poll_interval](std::stop_token self) {
    while (!self.stop_requested()) {
      if (int const sig{ termination_requested() }; sig != 0) {
        tui::info("Received signal %d, shutting the kernel down", sig);
        stop.request_stop();
        return;
      }
      std::this_thread::sleep_for(poll);
    }
  } };

  kernel_session session{ conf, prov, interpreters, std::move(params) };
  session.start(stop.get_token());
  return session.run(stop.get_token(), termination_take_interrupts);
}

}  // namespace uvk
