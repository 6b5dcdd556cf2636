#include "cli.h"

#include "doctest.h"

#include <filesystem>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace {

// Helper to convert vector of strings to argc/argv
std::vector<char *> make_argv(std::vector<std::string> &args) {
  std::vector<char *> argv;
  for (auto &arg : args) { argv.push_back(arg.data()); }
  argv.push_back(nullptr);
  return argv;
}

uvk::cli_args parse(std::vector<std::string> args) {
  args.insert(args.begin(), "uvk");
  auto argv{ make_argv(args) };
  return uvk::cli_parse(static_cast<int>(args.size()), argv.data());
}

template <typename cfg>
cfg parse_as(std::vector<std::string> args) {
  auto const parsed{ parse(std::move(args)) };
  REQUIRE_MESSAGE(parsed.cmd_cfg.has_value(), parsed.cli_output);
  REQUIRE(std::holds_alternative<cfg>(*parsed.cmd_cfg));
  return std::get<cfg>(*parsed.cmd_cfg);
}

using env_t = std::vector<std::pair<std::string, std::string>>;

}  // namespace

TEST_CASE("cli_parse: no arguments") {
  auto const parsed{ parse({}) };
  CHECK_FALSE(parsed.cmd_cfg.has_value());
  CHECK_FALSE(parsed.cli_output.empty());
}

TEST_CASE("cli_parse: version") {
  SUBCASE("subcommand") { parse_as<uvk::cmd_version::cfg>({ "version" }); }
  SUBCASE("-v flag") { parse_as<uvk::cmd_version::cfg>({ "-v" }); }
  SUBCASE("--version flag") { parse_as<uvk::cmd_version::cfg>({ "--version" }); }
}

TEST_CASE("cli_parse: install defaults") {
  auto const cfg{ parse_as<uvk::cmd_install::cfg>({ "install" }) };
  CHECK(cfg.name == "uvk");
  CHECK_FALSE(cfg.display_name.has_value());
  CHECK_FALSE(cfg.data_dir.user);
  CHECK_FALSE(cfg.data_dir.prefix.has_value());
  CHECK(cfg.env.empty());
  CHECK_FALSE(cfg.python.has_value());
}

TEST_CASE("cli_parse: install options") {
  auto const cfg{ parse_as<uvk::cmd_install::cfg>({ "install",
                                                    "--name",
                                                    "analysis",
                                                    "--display-name",
                                                    "Analysis",
                                                    "--user",
                                                    "-p",
                                                    ">=3.10,<3.12" }) };
  CHECK(cfg.name == "analysis");
  CHECK(cfg.display_name == "Analysis");
  CHECK(cfg.data_dir.user);
  CHECK(cfg.python == ">=3.10,<3.12");
}

TEST_CASE("cli_parse: install keeps --env and --tmp in command-line order") {
  auto const cfg{ parse_as<uvk::cmd_install::cfg>(
      { "install", "--env", "A", "1", "--tmp", "/scratch", "--env", "B", "2" }) };
  CHECK(cfg.env == env_t{ { "A", "1" }, { "TMPDIR", "/scratch" }, { "B", "2" } });
}

TEST_CASE("cli_parse: the last of --prefix and --sys-prefix wins") {
  SUBCASE("--prefix last") {
    auto const cfg{ parse_as<uvk::cmd_install::cfg>(
        { "install", "--sys-prefix", "--prefix", "/opt/a", "--prefix", "/opt/b" }) };
    CHECK(cfg.data_dir.prefix == std::filesystem::path{ "/opt/b" });
  }

  SUBCASE("--sys-prefix last") {
    auto const cfg{ parse_as<uvk::cmd_install::cfg>(
        { "install", "--prefix", "/opt/a", "--sys-prefix" }) };
    REQUIRE(cfg.data_dir.prefix.has_value());
    CHECK(*cfg.data_dir.prefix != std::filesystem::path{ "/opt/a" });
  }
}

TEST_CASE("cli_parse: uninstall and list") {
  auto const un{ parse_as<uvk::cmd_uninstall::cfg>({ "uninstall", "analysis", "--user" }) };
  CHECK(un.name == "analysis");
  CHECK(un.data_dir.user);

  auto const ls{ parse_as<uvk::cmd_list::cfg>({ "list", "--prefix", "/opt/env" }) };
  CHECK(ls.data_dir.prefix == std::filesystem::path{ "/opt/env" });

  CHECK_FALSE(parse({ "uninstall" }).cmd_cfg.has_value());
}

TEST_CASE("cli_parse: launch") {
  auto const cfg{ parse_as<uvk::cmd_launch::cfg>({ "launch",
                                                   "--kernel-name",
                                                   "analysis",
                                                   "--python",
                                                   "3.12",
                                                   "--with",
                                                   "numpy",
                                                   "--with",
                                                   "polars>=1",
                                                   "-f",
                                                   "/run/kernel-1.json" }) };
  CHECK(cfg.kernel_name == "analysis");
  CHECK(cfg.python == "3.12");
  CHECK(cfg.with == std::vector<std::string>{ "numpy", "polars>=1" });
  CHECK(cfg.connection_file == std::filesystem::path{ "/run/kernel-1.json" });

  CHECK_FALSE(parse({ "launch" }).cmd_cfg.has_value());
}

TEST_CASE("cli_parse: magic") {
  auto const cfg{ parse_as<uvk::cmd_magic::cfg>(
      { "magic", "--cell", "-", "%%dependencies", "numpy" }) };
  CHECK(cfg.line == std::vector<std::string>{ "%%dependencies", "numpy" });
  CHECK(cfg.cell == std::filesystem::path{ "-" });
}

TEST_CASE("cli_parse: verbosity") {
  CHECK(parse({ "version" }).verbosity == uvk::tui::level::TUI_INFO);
  CHECK(parse({ "-q", "version" }).verbosity == uvk::tui::level::TUI_WARN);
  CHECK(parse({ "-qq", "version" }).verbosity == uvk::tui::level::TUI_ERROR);
  CHECK(parse({ "-qqq", "version" }).verbosity == uvk::tui::level::TUI_ERROR);
  CHECK(parse({ "--debug", "version" }).verbosity == uvk::tui::level::TUI_DEBUG);
  CHECK(parse({ "install", "-q" }).verbosity == uvk::tui::level::TUI_WARN);

  auto const verbose{ parse({ "--verbose", "version" }) };
  CHECK(verbose.verbosity == uvk::tui::level::TUI_DEBUG);
  CHECK(verbose.decorated_logging);
}

TEST_CASE("cli_parse: trace outputs") {
  SUBCASE("default stderr") {
    auto const parsed{ parse({ "--trace", "version" }) };
    REQUIRE(parsed.trace_outputs.size() == 1);
    CHECK(parsed.trace_outputs[0].type == uvk::tui::trace_output_type::std_err);
    CHECK(parsed.verbosity == uvk::tui::level::TUI_TRACE);
  }

  SUBCASE("stderr and file") {
    auto const parsed{ parse({ "--trace=stderr,file:/tmp/uvk-trace.jsonl", "version" }) };
    REQUIRE(parsed.trace_outputs.size() == 2);
    CHECK(parsed.trace_outputs[1].type == uvk::tui::trace_output_type::file);
    CHECK(parsed.trace_outputs[1].file_path == std::filesystem::path{ "/tmp/uvk-trace.jsonl" });
  }

  SUBCASE("invalid spec") {
    auto const parsed{ parse({ "--trace=bogus", "version" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK(parsed.cli_output.find("bogus") != std::string::npos);
  }
}

TEST_CASE("cli_verbosity") {
  CHECK(uvk::cli_verbosity(0, false) == uvk::tui::level::TUI_INFO);
  CHECK(uvk::cli_verbosity(1, false) == uvk::tui::level::TUI_WARN);
  CHECK(uvk::cli_verbosity(5, false) == uvk::tui::level::TUI_ERROR);
  CHECK(uvk::cli_verbosity(2, true) == uvk::tui::level::TUI_DEBUG);
}
