#include "cli.h"
#include "tui.h"

#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <variant>

int main(int argc, char **argv) {
  uvk::tui::init();

  auto args{ uvk::cli_parse(argc, argv) };
  uvk::tui::configure_trace_outputs(args.trace_outputs);
  if (args.cmd_cfg) {
    if (auto const *launch{ std::get_if<uvk::cmd_launch::cfg>(&*args.cmd_cfg) }) {
      uvk::tui::set_source_tag(launch->kernel_name);
    }
  }
  uvk::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      uvk::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    uvk::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  auto cmd{ std::visit([&](auto const &cfg) { return uvk::cmd::create(cfg, args.config_path); },
                       *args.cmd_cfg) };

  // Runtime failures (bad input, missing files, failed environments, I/O) exit 1; anything
  // else exits 2.
  try {
    return cmd->execute();
  } catch (std::runtime_error const &ex) {
    uvk::tui::error("%s", ex.what());
    return 1;
  } catch (std::exception const &ex) {
    uvk::tui::error("Execution failed: %s; abort", ex.what());
    return 2;
  }
}
