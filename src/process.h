#pragma once

#include "util.h"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace uvk {

using process_env_t = std::unordered_map<std::string, std::string>;

struct exit_status {
  int exit_code;
  std::optional<int> signal;

  bool clean() const { return exit_code == 0 && !signal; }
};

// Outcome of a bounded external command. A nonzero exit is a value, not an exception.
struct process_result {
  int exit_code{ 0 };
  std::optional<int> signal;
  bool timed_out{ false };
  bool cancelled{ false };
  bool launch_failed{ false };  // executable missing or exec() failed
  std::string output;           // stdout, interleaved with stderr when merged

  bool ok() const {
    return exit_code == 0 && !signal && !timed_out && !cancelled && !launch_failed;
  }
};

struct process_run_cfg {
  std::function<void(std::string_view)> on_output_line;
  std::optional<std::filesystem::path> cwd;
  std::optional<process_env_t> env;  // nullopt inherits the current environment
  std::optional<std::chrono::milliseconds> timeout;
  std::stop_token stop;
  bool merge_stderr{ true };  // false: stderr is inherited and kept out of `output`
};

process_env_t process_getenv();

// Runs argv[0] (looked up on PATH when it has no slash) to completion, capturing output.
// The child runs in its own process group; on timeout or stop request the whole group
// is killed. Throws std::system_error only when pipe/fork themselves fail.
process_result process_run(std::vector<std::string> const &argv, process_run_cfg const &cfg);

std::string process_format_argv(std::vector<std::string> const &argv);

// Long-running child (the kernel). Standard streams are inherited.
class child_process : unmovable {
 public:
  struct cfg {
    std::vector<std::string> argv;
    std::optional<std::filesystem::path> cwd;
    process_env_t env;
  };

  // Throws std::system_error if the process cannot be started, including exec failure.
  static std::unique_ptr<child_process> spawn(cfg const &config);

  ~child_process();

  int pid() const { return pid_; }

  // Non-blocking reap. Once reaped the status is cached.
  std::optional<exit_status> try_wait();
  std::optional<exit_status> wait_for(std::chrono::milliseconds timeout);

  // Signals the child's process group. No-op after the child has been reaped.
  void send_signal(int sig);

 private:
  explicit child_process(int pid) : pid_{ pid } {}

  int pid_;
  std::optional<exit_status> status_;
};

}  // namespace uvk
