#pragma once

#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#define UVK_UNREACHABLE() __builtin_unreachable()

namespace uvk::platform {

// Exclusive advisory lock on a lock file, held until destruction. Serialises threads of
// this process as well as other processes.
class file_lock : uncopyable {
 public:
  explicit file_lock(std::filesystem::path const &path);
  ~file_lock();
  file_lock(file_lock &&) noexcept;
  file_lock &operator=(file_lock &&) noexcept;

  explicit operator bool() const;

 private:
  struct impl;
  std::unique_ptr<impl> impl_;
};

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to);
bool file_exists(std::filesystem::path const &path);

// Write to a sibling temp file, fsync, then rename over `path`. Readers observe
// either the old or the new content, never a partial file.
void write_file_atomic(std::filesystem::path const &path, std::string_view content);

// mkdtemp under `parent`; the returned directory did not exist before the call.
std::filesystem::path make_unique_dir(std::filesystem::path const &parent,
                                      std::string_view prefix);

std::error_code remove_all_with_retry(std::filesystem::path const &target);

bool is_executable(std::filesystem::path const &path);
std::optional<std::filesystem::path> find_executable(std::string_view name);

std::filesystem::path get_exe_path();
int current_pid();

// $TMPDIR (or the system temp dir) / "uvk"
std::filesystem::path get_default_scratch_root();

// Jupyter data directories. Each has a "kernels" subdirectory holding kernelspecs.
std::optional<std::filesystem::path> get_user_data_dir();
std::filesystem::path get_system_data_dir();
std::filesystem::path get_prefix_data_dir(std::filesystem::path const &prefix);
std::vector<std::filesystem::path> get_jupyter_path_entries();

// Candidate config files, in lookup order, from the environment.
std::vector<std::filesystem::path> get_config_candidates();

void env_var_set(char const *name, char const *value);
void env_var_unset(char const *name);
std::optional<std::string> env_var_get(char const *name);

bool is_tty();

}  // namespace uvk::platform
