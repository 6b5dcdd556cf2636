#include "test_support.h"

#include "mutation.h"
#include "platform.h"
#include "process.h"
#include "uv.h"

#include <algorithm>
#include <functional>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <thread>

namespace uvk::test {

namespace {

std::filesystem::path packages_file(std::filesystem::path const &root) {
  return root / ".fake-packages";
}

void write_packages(std::filesystem::path const &root, std::vector<std::string> lines) {
  std::sort(lines.begin(), lines.end());
  std::string content;
  for (auto const &line : lines) { content += line + "\n"; }
  util_write_file(packages_file(root), content);
}

std::string pinned(std::string_view requirement) {
  auto const name{ requirement_name(requirement) };
  auto const eq{ requirement.find("==") };
  if (eq == std::string_view::npos) { return name + "==1.0"; }
  return name + "==" + std::string{ util_trim(requirement.substr(eq + 2)) };
}

// False when `stop` fired before `delay` elapsed. `tick` runs on every wake-up.
bool sleep_unless_stopped(std::chrono::milliseconds delay,
                          std::stop_token const &stop,
                          std::function<void()> const &tick = {}) {
  auto const deadline{ std::chrono::steady_clock::now() + delay };
  while (std::chrono::steady_clock::now() < deadline) {
    if (stop.stop_requested()) { return false; }
    if (tick) { tick(); }
    std::this_thread::sleep_for(std::chrono::milliseconds{ 5 });
  }
  return !stop.stop_requested();
}

}  // namespace

temp_dir::temp_dir(std::string_view tag)
    : path_{ platform::make_unique_dir(std::filesystem::temp_directory_path(),
                                       "uvk-" + std::string{ tag } + "-") },
      cleanup_{ path_ } {}

void write_stub_python(std::filesystem::path const &path,
                       std::string_view version,
                       std::string_view body) {
  std::filesystem::create_directories(path.parent_path());
  std::string script{ "#!/bin/sh\n" };
  script += "if [ \"$1\" = \"--version\" ]; then echo \"Python " + std::string{ version } +
            "\"; exit 0; fi\n";
  script += body.empty() ? std::string{ "exit 0\n" } : std::string{ body } + "\n";
  util_write_file(path, script);
  std::filesystem::permissions(path,
                               std::filesystem::perms::owner_all |
                                   std::filesystem::perms::group_read |
                                   std::filesystem::perms::group_exec,
                               std::filesystem::perm_options::replace);
}

build_result fake_env_builder::build(std::filesystem::path const &interpreter,
                                     std::filesystem::path const &root,
                                     std::vector<std::string> const &dependencies,
                                     build_options const &opts) {
  record("build " + interpreter.string() + " " + util_join(dependencies, " "));

  if (!sleep_unless_stopped(build_delay, opts.stop)) {
    return { .cancelled = true, .output = "cancelled" };
  }

  std::filesystem::create_directories(root);
  if (fail_build) {
    util_write_file(root / "partial", "half-built");
    return { .output = "error: failed to build environment" };
  }
  if (!omit_python) { write_stub_python(env_python_path(root), interpreter_version, python_body); }

  std::vector<std::string> lines;
  for (auto const &dep : dependencies) { lines.push_back(pinned(dep)); }
  write_packages(root, lines);
  return { .success = true, .output = "Using CPython " + interpreter_version };
}

build_result fake_env_builder::install(std::filesystem::path const &root,
                                       std::vector<std::string> const &dependencies,
                                       build_options const &opts) {
  record("install " + util_join(dependencies, " "));
  bool lost_root{ false };
  bool const finished{ sleep_unless_stopped(install_delay, opts.stop, [&] {
    if (!lost_root && !std::filesystem::exists(root)) {
      lost_root = true;
      record("install lost root");
    }
  }) };
  if (!finished) { return { .cancelled = true, .output = "cancelled" }; }

  auto lines{ installed_packages(root) };
  for (auto const &dep : dependencies) {
    auto const name{ requirement_name(dep) };
    if (fail_on_package && *fail_on_package == name) {
      write_packages(root, lines);
      return { .output = "error: no matching distribution for " + dep };
    }
    std::erase_if(lines, [&](auto const &line) { return requirement_name(line) == name; });
    lines.push_back(pinned(dep));
    write_packages(root, lines);
  }
  return { .success = true, .output = "Installed " + std::to_string(dependencies.size()) };
}

build_result fake_env_builder::freeze(std::filesystem::path const &root, build_options const &) {
  record("freeze");
  if (!platform::file_exists(packages_file(root))) {
    return { .output = "error: no environment at " + root.string() };
  }
  return { .success = true, .output = util_load_text(packages_file(root)) };
}

build_result fake_env_builder::sync(std::filesystem::path const &root,
                                    std::vector<std::string> const &requirements,
                                    build_options const &) {
  record("sync " + util_join(requirements, " "));
  if (fail_sync) { return { .output = "error: sync failed" }; }

  auto lines{ requirements };
  if (corrupt_sync) { lines.push_back("stray==0.1"); }
  write_packages(root, lines);
  return { .success = true };
}

std::vector<std::string> fake_env_builder::installed_packages(std::filesystem::path const &root) {
  if (!platform::file_exists(packages_file(root))) { return {}; }
  return freeze_lines(util_load_text(packages_file(root)));
}

std::vector<std::string> fake_env_builder::calls() const {
  std::lock_guard lock{ mutex_ };
  return calls_;
}

int fake_env_builder::call_count(std::string_view verb) const {
  std::lock_guard lock{ mutex_ };
  return static_cast<int>(std::count_if(calls_.begin(), calls_.end(), [&](auto const &c) {
    return c.rfind(verb, 0) == 0;
  }));
}

void fake_env_builder::record(std::string call) {
  std::lock_guard lock{ mutex_ };
  calls_.push_back(std::move(call));
}

installed_interpreter fake_interpreter_source::add_installed(std::string_view version) {
  auto const parsed{ python_version::parse(version) };
  if (!parsed) { throw std::invalid_argument("bad version: " + std::string{ version }); }

  auto const path{ dir_ / ("python" + std::string{ version }) };
  write_stub_python(path, parsed->str());
  installed_.push_back({ .path = path, .version = *parsed });
  return installed_.back();
}

void fake_interpreter_source::add_installable(std::string_view version) {
  auto const parsed{ python_version::parse(version) };
  if (!parsed) { throw std::invalid_argument("bad version: " + std::string{ version }); }
  installable_.push_back(*parsed);
}

std::vector<installed_interpreter> fake_interpreter_source::list_installed() {
  ++list_calls_;
  return installed_;
}

build_result fake_interpreter_source::install(specifier_set const &constraint) {
  ++install_calls_;
  auto const best{ select_highest(installable_, constraint) };
  if (!best) { return { .output = "error: no download found for " + constraint.text() }; }

  std::erase(installable_, *best);
  add_installed(best->str());
  return { .success = true, .output = "Installed Python " + best->str() };
}

std::optional<python_version> fake_interpreter_source::query_version(
    std::filesystem::path const &path) {
  for (auto const &i : installed_) {
    if (i.path == path) { return i.version; }
  }
  auto const r{ process_run({ path.string(), "--version" }, {}) };
  if (!r.ok()) { return std::nullopt; }
  return uv_parse_python_version_output(r.output);
}

}  // namespace uvk::test
