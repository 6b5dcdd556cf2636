#include "platform.h"

#include "doctest.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace uvk {

namespace {

std::filesystem::path make_scratch(char const *tag) {
  auto const base{ std::filesystem::temp_directory_path() / "uvk-platform-tests" };
  std::filesystem::create_directories(base);
  return platform::make_unique_dir(base, std::string{ tag } + "-");
}

// Restores an environment variable on scope exit.
class env_guard : unmovable {
 public:
  explicit env_guard(char const *name) : name_{ name }, old_{ platform::env_var_get(name) } {}
  ~env_guard() {
    if (old_) {
      ::setenv(name_, old_->c_str(), 1);
    } else {
      ::unsetenv(name_);
    }
  }

 private:
  char const *name_;
  std::optional<std::string> old_;
};

}  // namespace

TEST_CASE("platform::get_exe_path returns valid path") {
  auto const path{ platform::get_exe_path() };

  CHECK(!path.empty());
  CHECK(path.is_absolute());
  CHECK(std::filesystem::exists(path));
  CHECK(std::filesystem::is_regular_file(path));
}

TEST_CASE("platform::make_unique_dir creates distinct directories") {
  auto const a{ make_scratch("unique") };
  auto const b{ make_scratch("unique") };
  scoped_path_cleanup ca{ a };
  scoped_path_cleanup cb{ b };

  CHECK(a != b);
  CHECK(std::filesystem::is_directory(a));
  CHECK(std::filesystem::is_directory(b));
  CHECK(a.filename().string().rfind("unique-", 0) == 0);
}

TEST_CASE("platform::make_unique_dir throws when parent is missing") {
  CHECK_THROWS_AS(platform::make_unique_dir("/nonexistent/uvk/parent", "x-"),
                  std::system_error);
}

TEST_CASE("platform::write_file_atomic replaces content and leaves no temp files") {
  auto const dir{ make_scratch("atomic") };
  scoped_path_cleanup cleanup{ dir };
  auto const target{ dir / "kernel.json" };

  platform::write_file_atomic(target, "first");
  CHECK(util_load_text(target) == "first");

  platform::write_file_atomic(target, "second");
  CHECK(util_load_text(target) == "second");

  size_t entries{ 0 };
  for (auto const &e : std::filesystem::directory_iterator{ dir }) {
    static_cast<void>(e);
    ++entries;
  }
  CHECK(entries == 1);
}

TEST_CASE("platform::atomic_rename moves directories and reports failure") {
  auto const dir{ make_scratch("rename") };
  scoped_path_cleanup cleanup{ dir };
  std::filesystem::create_directories(dir / "from" / "inner");

  platform::atomic_rename(dir / "from", dir / "to");
  CHECK(std::filesystem::is_directory(dir / "to" / "inner"));
  CHECK_FALSE(std::filesystem::exists(dir / "from"));

  CHECK_THROWS_AS(platform::atomic_rename(dir / "missing", dir / "other"),
                  std::system_error);
}

TEST_CASE("platform::file_lock serialises threads of one process") {
  auto const dir{ make_scratch("lock") };
  scoped_path_cleanup cleanup{ dir };
  auto const lock_path{ dir / ".lock" };

  int counter{ 0 };
  int max_inside{ 0 };
  int inside{ 0 };
  std::vector<std::thread> threads;
  for (int i{ 0 }; i < 4; ++i) {
    threads.emplace_back([&] {
      for (int j{ 0 }; j < 25; ++j) {
        platform::file_lock lock{ lock_path };
        ++inside;
        if (inside > max_inside) { max_inside = inside; }
        ++counter;
        --inside;
      }
    });
  }
  for (auto &t : threads) { t.join(); }

  CHECK(counter == 100);
  CHECK(max_inside == 1);
  CHECK(std::filesystem::exists(lock_path));
}

TEST_CASE("platform::is_executable") {
  auto const dir{ make_scratch("exec") };
  scoped_path_cleanup cleanup{ dir };

  auto const script{ dir / "python3" };
  util_write_file(script, "#!/bin/sh\nexit 0\n");
  CHECK_FALSE(platform::is_executable(script));

  std::filesystem::permissions(script,
                               std::filesystem::perms::owner_exec,
                               std::filesystem::perm_options::add);
  CHECK(platform::is_executable(script));
  CHECK_FALSE(platform::is_executable(dir));
  CHECK_FALSE(platform::is_executable(dir / "absent"));
}

TEST_CASE("platform::find_executable searches PATH") {
  auto const dir{ make_scratch("which") };
  scoped_path_cleanup cleanup{ dir };
  auto const tool{ dir / "uvk-fake-tool" };
  util_write_file(tool, "#!/bin/sh\n");
  std::filesystem::permissions(tool, std::filesystem::perms::owner_all);

  env_guard guard{ "PATH" };
  platform::env_var_set("PATH", ("/nonexistent::" + dir.string()).c_str());

  auto const found{ platform::find_executable("uvk-fake-tool") };
  REQUIRE(found.has_value());
  CHECK(*found == tool);
  CHECK_FALSE(platform::find_executable("uvk-not-a-tool").has_value());
  CHECK_FALSE(platform::find_executable("").has_value());
}

TEST_CASE("platform::get_user_data_dir honours JUPYTER_DATA_DIR") {
  env_guard guard{ "JUPYTER_DATA_DIR" };
  platform::env_var_set("JUPYTER_DATA_DIR", "/opt/jupyter-data");
  auto const dir{ platform::get_user_data_dir() };
  REQUIRE(dir.has_value());
  CHECK(*dir == std::filesystem::path{ "/opt/jupyter-data" });
}

#ifndef __APPLE__
TEST_CASE("platform::get_user_data_dir falls back to XDG_DATA_HOME") {
  env_guard g1{ "JUPYTER_DATA_DIR" };
  env_guard g2{ "XDG_DATA_HOME" };
  platform::env_var_unset("JUPYTER_DATA_DIR");
  platform::env_var_set("XDG_DATA_HOME", "/xdg/data");
  auto const dir{ platform::get_user_data_dir() };
  REQUIRE(dir.has_value());
  CHECK(*dir == std::filesystem::path{ "/xdg/data/jupyter" });
}
#endif

TEST_CASE("platform::get_prefix_data_dir") {
  CHECK(platform::get_prefix_data_dir("/opt/conda") ==
        std::filesystem::path{ "/opt/conda/share/jupyter" });
}

TEST_CASE("platform::get_jupyter_path_entries splits on colons") {
  env_guard guard{ "JUPYTER_PATH" };
  platform::env_var_set("JUPYTER_PATH", "/a:/b::/c");
  auto const entries{ platform::get_jupyter_path_entries() };
  CHECK(entries == std::vector<std::filesystem::path>{ "/a", "/b", "/c" });

  platform::env_var_unset("JUPYTER_PATH");
  CHECK(platform::get_jupyter_path_entries().empty());
}

TEST_CASE("platform::get_config_candidates lists UVK_CONFIG first") {
  env_guard g1{ "UVK_CONFIG" };
  env_guard g2{ "XDG_CONFIG_HOME" };
  platform::env_var_set("UVK_CONFIG", "/etc/uvk.lua");
  platform::env_var_set("XDG_CONFIG_HOME", "/xdg/config");

  auto const candidates{ platform::get_config_candidates() };
  REQUIRE(candidates.size() >= 2);
  CHECK(candidates[0] == std::filesystem::path{ "/etc/uvk.lua" });
  CHECK(candidates[1] == std::filesystem::path{ "/xdg/config/uvk/config.lua" });
}

TEST_CASE("platform::get_default_scratch_root uses TMPDIR") {
  env_guard guard{ "TMPDIR" };
  platform::env_var_set("TMPDIR", "/scratch");
  CHECK(platform::get_default_scratch_root() == std::filesystem::path{ "/scratch/uvk" });
}

TEST_CASE("platform::env_var helpers round trip") {
  env_guard guard{ "UVK_PLATFORM_TEST_VAR" };
  platform::env_var_set("UVK_PLATFORM_TEST_VAR", "value");
  CHECK(platform::env_var_get("UVK_PLATFORM_TEST_VAR") == std::optional<std::string>{ "value" });
  platform::env_var_unset("UVK_PLATFORM_TEST_VAR");
  CHECK_FALSE(platform::env_var_get("UVK_PLATFORM_TEST_VAR").has_value());
  CHECK_THROWS_AS(platform::env_var_set(nullptr, "x"), std::invalid_argument);
}

}  // namespace uvk
