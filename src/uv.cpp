#include "uv.h"

#include "platform.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace uvk {

namespace {

process_result run_tool(std::vector<std::string> const &argv,
                        build_options const &opts,
                        bool merge_stderr = true) {
  auto const command{ process_format_argv(argv) };
  tui::debug("Running: %s", command.c_str());
  UVK_TRACE_COMMAND_START(command, std::string{});

  auto const start{ std::chrono::steady_clock::now() };
  auto result{ process_run(argv,
                           { .on_output_line =
                                 [](std::string_view line) {
                                   tui::debug("  %.*s",
                                              static_cast<int>(line.size()),
                                              line.data());
                                 },
                             .timeout = opts.timeout,
                             .stop = opts.stop,
                             .merge_stderr = merge_stderr }) };
  auto const duration_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - start)
                              .count() };

  UVK_TRACE_COMMAND_COMPLETE(command, result.exit_code, static_cast<std::int64_t>(duration_ms));
  if (result.timed_out) { tui::warn("Timed out: %s", command.c_str()); }
  return result;
}

}  // namespace

namespace uv_argv {

std::vector<std::string> venv(std::filesystem::path const &uv,
                              std::filesystem::path const &interpreter,
                              std::filesystem::path const &root) {
  return { uv.string(), "venv", "--quiet", "--python", interpreter.string(), root.string() };
}

std::vector<std::string> pip_install(std::filesystem::path const &uv,
                                     std::filesystem::path const &root,
                                     std::vector<std::string> const &dependencies) {
  std::vector<std::string> argv{
    uv.string(), "pip", "install", "--python", env_python_path(root).string()
  };
  argv.insert(argv.end(), dependencies.begin(), dependencies.end());
  return argv;
}

std::vector<std::string> pip_freeze(std::filesystem::path const &uv,
                                    std::filesystem::path const &root) {
  return { uv.string(), "pip", "freeze", "--python", env_python_path(root).string() };
}

std::vector<std::string> pip_sync(std::filesystem::path const &uv,
                                  std::filesystem::path const &root,
                                  std::filesystem::path const &requirements_file) {
  return { uv.string(),
           "pip",
           "sync",
           "--python",
           env_python_path(root).string(),
           requirements_file.string() };
}

std::vector<std::string> python_list(std::filesystem::path const &uv) {
  return { uv.string(), "python", "list", "--only-installed", "--output-format", "json" };
}

std::vector<std::string> python_install(std::filesystem::path const &uv,
                                        std::string const &request) {
  return { uv.string(), "python", "install", request };
}

}  // namespace uv_argv

std::vector<installed_interpreter> uv_parse_python_list(std::string_view json) {
  std::vector<installed_interpreter> result;

  auto const doc = nlohmann::json::parse(json, nullptr, false);
  if (doc.is_discarded() || !doc.is_array()) {
    tui::warn("Unexpected output from uv python list");
    return result;
  }

  for (auto const &entry : doc) {
    if (!entry.is_object()) { continue; }
    auto const impl{ entry.value("implementation", std::string{ "cpython" }) };
    if (impl != "cpython") { continue; }

    auto const path_it{ entry.find("path") };
    auto const version_it{ entry.find("version") };
    if (path_it == entry.end() || !path_it->is_string()) { continue; }
    if (version_it == entry.end() || !version_it->is_string()) { continue; }

    auto const version{ python_version::parse(version_it->get<std::string>()) };
    if (!version) { continue; }

    result.push_back({ .path = std::filesystem::path{ path_it->get<std::string>() },
                       .version = *version });
  }
  return result;
}

std::optional<python_version> uv_parse_python_version_output(std::string_view text) {
  for (auto const line : util_split_lines(text)) {
    auto const trimmed{ util_trim(line) };
    constexpr std::string_view kPrefix{ "Python " };
    if (trimmed.substr(0, kPrefix.size()) == kPrefix) {
      return python_version::parse(trimmed.substr(kPrefix.size()));
    }
  }
  return std::nullopt;
}

build_result uv_env_builder::build(std::filesystem::path const &interpreter,
                                   std::filesystem::path const &root,
                                   std::vector<std::string> const &dependencies,
                                   build_options const &opts) {
  auto result{ build_result::from(run_tool(uv_argv::venv(uv_, interpreter, root), opts)) };
  if (!result.success || dependencies.empty()) { return result; }
  return install(root, dependencies, opts);
}

build_result uv_env_builder::install(std::filesystem::path const &root,
                                     std::vector<std::string> const &dependencies,
                                     build_options const &opts) {
  if (dependencies.empty()) { return { .success = true }; }
  return build_result::from(run_tool(uv_argv::pip_install(uv_, root, dependencies), opts));
}

build_result uv_env_builder::freeze(std::filesystem::path const &root,
                                    build_options const &opts) {
  return build_result::from(run_tool(uv_argv::pip_freeze(uv_, root), opts, false));
}

build_result uv_env_builder::sync(std::filesystem::path const &root,
                                  std::vector<std::string> const &requirements,
                                  build_options const &opts) {
  auto const req_file{ root / (".uvk-sync-" + util_random_hex(6) + ".txt") };
  scoped_path_cleanup cleanup{ req_file };
  util_write_file(req_file, util_join(requirements, "\n") + "\n");
  return build_result::from(run_tool(uv_argv::pip_sync(uv_, root, req_file), opts));
}

std::vector<installed_interpreter> uv_interpreter_source::list_installed() {
  auto const result{ run_tool(uv_argv::python_list(uv_), { .timeout = install_timeout_ }, false) };
  if (!result.ok()) {
    tui::warn("uv python list failed (exit %d)", result.exit_code);
    return {};
  }
  return uv_parse_python_list(result.output);
}

build_result uv_interpreter_source::install(specifier_set const &constraint) {
  return build_result::from(
      run_tool(uv_argv::python_install(uv_, constraint.text()), { .timeout = install_timeout_ }));
}

std::optional<python_version> uv_interpreter_source::query_version(
    std::filesystem::path const &path) {
  auto const result{ run_tool({ path.string(), "--version" },
                              { .timeout = std::chrono::milliseconds{ 30000 } }) };
  if (!result.ok()) { return std::nullopt; }
  return uv_parse_python_version_output(result.output);
}

}  // namespace uvk
