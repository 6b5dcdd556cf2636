#pragma once

#include "process.h"

#include <chrono>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace uvk {

// Result of one call into the environment-building tool. Output is kept for error
// reporting; success is decided by the exit status alone.
struct build_result {
  bool success{ false };
  bool timed_out{ false };
  bool cancelled{ false };
  std::string output;

  static build_result from(process_result const &r) {
    return { .success = r.ok(),
             .timed_out = r.timed_out,
             .cancelled = r.cancelled,
             .output = r.output };
  }
};

struct build_options {
  std::optional<std::chrono::milliseconds> timeout;
  std::stop_token stop;
};

// External collaborator that materialises and edits isolated environments.
class env_builder {
 public:
  virtual ~env_builder() = default;

  // Create a fresh environment at `root` bound to `interpreter`, with `dependencies`.
  virtual build_result build(std::filesystem::path const &interpreter,
                             std::filesystem::path const &root,
                             std::vector<std::string> const &dependencies,
                             build_options const &opts) = 0;

  virtual build_result install(std::filesystem::path const &root,
                               std::vector<std::string> const &dependencies,
                               build_options const &opts) = 0;

  // On success `output` holds one "name==version" requirement per line.
  virtual build_result freeze(std::filesystem::path const &root,
                              build_options const &opts) = 0;

  // Make the installed set exactly `requirements` (as produced by freeze).
  virtual build_result sync(std::filesystem::path const &root,
                            std::vector<std::string> const &requirements,
                            build_options const &opts) = 0;
};

inline std::filesystem::path env_python_path(std::filesystem::path const &root) {
  return root / "bin" / "python";
}

}  // namespace uvk
