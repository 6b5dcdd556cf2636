#pragma once

#include "interpreter.h"

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace uvk {

struct kernel_spec {
  std::string name;
  std::string display_name;
  std::optional<interpreter_selector> python;  // nullopt: highest installed interpreter
  std::vector<std::pair<std::string, std::string>> env;  // later entries win
  std::optional<std::filesystem::path> icon;  // install: source file; list: installed logo
  std::string language{ "python" };
  std::chrono::system_clock::time_point created;

  // Filled in by the registry when reading an entry back.
  std::vector<std::string> argv;
  std::filesystem::path resource_dir;
};

// Jupyter kernel names: ASCII letters, digits, '.', '_' and '-'.
bool kernel_spec_name_valid(std::string_view name);

// "UVK (Python 3.12)" when the selector names a version, else "UVK".
std::string kernel_spec_default_display_name(std::optional<interpreter_selector> const &python);

// argv the host runs to start the kernel: uvk itself, which provisions the environment.
std::vector<std::string> kernel_spec_argv(std::filesystem::path const &launcher,
                                          kernel_spec const &spec);

std::string kernel_spec_to_json(kernel_spec const &spec, std::filesystem::path const &launcher);

// nullopt for malformed documents; `name` is the directory name.
std::optional<kernel_spec> kernel_spec_from_json(std::string_view json, std::string name);

std::filesystem::path kernelspec_kernels_dir(std::filesystem::path const &data_dir);

// Kernel specs under one `kernels` directory. Mutations hold an exclusive lock on
// <kernels_dir>/.uvk-registry.lock and publish each entry with a directory rename, so a
// concurrent reader sees either the old entry, the new one, or none, never a partial one.
class kernelspec_registry {
 public:
  kernelspec_registry(std::filesystem::path kernels_dir, std::filesystem::path launcher);

  // Overwrites an existing entry of the same name. Throws registry_error; a failed
  // overwrite leaves the previous entry in place.
  void install(kernel_spec const &spec);

  // False (and no error) when `name` is not installed. Throws registry_error on I/O failure.
  bool uninstall(std::string const &name);

  // Sorted by name; unreadable entries are skipped with a warning.
  std::vector<kernel_spec> list() const;
  std::optional<kernel_spec> find(std::string const &name) const;

  std::filesystem::path const &kernels_dir() const { return kernels_dir_; }

  // Called with the staged entry just before it is renamed into place.
  void set_publish_observer(std::function<void(std::filesystem::path const &)> observer) {
    publish_observer_ = std::move(observer);
  }

 private:
  std::filesystem::path kernels_dir_;
  std::filesystem::path launcher_;
  std::function<void(std::filesystem::path const &)> publish_observer_;
};

}  // namespace uvk
