#include "cli.h"
#include "tui.h"

#include "CLI11.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace uvk {

namespace {

// "stderr", "file:<path>", or a comma-separated mix. Empty means stderr.
std::optional<std::vector<tui::trace_output_spec>> parse_trace_outputs(std::string_view spec) {
  std::vector<tui::trace_output_spec> outputs;
  if (spec.empty()) {
    outputs.push_back({ tui::trace_output_type::std_err, std::nullopt });
    return outputs;
  }

  constexpr std::string_view kFilePrefix{ "file:" };
  while (!spec.empty()) {
    auto const comma{ spec.find(',') };
    auto const token{ spec.substr(0, comma) };
    spec = comma == std::string_view::npos ? std::string_view{} : spec.substr(comma + 1);

    if (token.empty()) { continue; }
    if (token == "stderr") {
      outputs.push_back({ tui::trace_output_type::std_err, std::nullopt });
    } else if (token.starts_with(kFilePrefix) && token.size() > kFilePrefix.size()) {
      outputs.push_back({ tui::trace_output_type::file,
                          std::filesystem::path{ token.substr(kFilePrefix.size()) } });
    } else {
      return std::nullopt;
    }
  }
  if (outputs.empty()) { return std::nullopt; }
  return outputs;
}

}  // namespace

tui::level cli_verbosity(int quiet, bool debug) {
  if (debug) { return tui::level::TUI_DEBUG; }
  switch (quiet) {
    case 0: return tui::level::TUI_INFO;
    case 1: return tui::level::TUI_WARN;
    default: return tui::level::TUI_ERROR;
  }
}

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "uvk - Jupyter kernels in ephemeral uv environments" };
  app.require_subcommand(0, 1);

  bool verbose{ false };
  app.add_flag("--verbose", verbose, "Debug output with timestamp and level on each line");

  int quiet{ 0 };
  app.add_flag("-q,--quiet", quiet, "Only warnings; repeat (-qq) for errors only");

  bool debug{ false };
  app.add_flag("--debug", debug, "Debug output");

  std::string trace_spec;
  auto *trace_option{ app.add_option(
      "--trace",
      trace_spec,
      "Structured lifecycle events: 'stderr', 'file:<path>' (JSONL), or both comma-separated") };
  trace_option->expected(0, 1);

  std::optional<std::filesystem::path> config_path;
  app.add_option("--config", config_path, "Lua configuration file")
      ->check(CLI::ExistingFile);

  bool version_flag{ false };
  app.add_flag("-v,--version", version_flag, "Show version information");

  std::optional<cli_args::cmd_cfg_t> cmd_cfg;
  auto const on_selected{ [&cmd_cfg](auto cfg) { cmd_cfg = std::move(cfg); } };

  cmd_install::register_cli(app, on_selected);
  cmd_uninstall::register_cli(app, on_selected);
  cmd_list::register_cli(app, on_selected);
  cmd_launch::register_cli(app, on_selected);
  cmd_magic::register_cli(app, on_selected);
  cmd_version::register_cli(app, on_selected);

  // Subcommands accept the global options after their own name as well.
  for (auto *sub : app.get_subcommands([](CLI::App *) { return true; })) {
    sub->fallthrough();
  }

  cli_args args{};

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
  } catch (CLI::ParseError const &e) { args.cli_output = std::string(e.what()); }

  args.config_path = config_path;

  if (trace_option->count() > 0) {
    if (auto outputs{ parse_trace_outputs(trace_spec) }) {
      args.trace_outputs = std::move(*outputs);
      args.verbosity = tui::level::TUI_TRACE;
      args.decorated_logging = true;
    } else {
      args.cli_output = "Invalid trace output spec: " + trace_spec;
      cmd_cfg.reset();
    }
  } else {
    args.verbosity = cli_verbosity(quiet, debug || verbose);
    args.decorated_logging = verbose;
  }

  if (version_flag && args.cli_output.empty()) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  if (cmd_cfg) {
    args.cmd_cfg = std::move(*cmd_cfg);
  } else if (args.cli_output.empty()) {
    args.cli_output = app.help();
  }

  return args;
}

}  // namespace uvk
