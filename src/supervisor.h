#pragma once

#include "handshake.h"
#include "process.h"
#include "provisioner.h"
#include "util.h"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace uvk {

enum class kernel_state { created, launching, running, shutting_down, crashed, terminated };

std::string_view kernel_state_name(kernel_state state);

struct supervisor_options {
  std::chrono::milliseconds handshake_timeout{ 30000 };
  std::chrono::milliseconds grace_period{ 5000 };
  std::chrono::milliseconds poll_interval{ 100 };
};

// `python -m ipykernel_launcher -f <connection file>` inside the environment.
std::vector<std::string> kernel_argv(ephemeral_environment const &env,
                                     std::filesystem::path const &connection_file);

// `base` with the environment activated: VIRTUAL_ENV set, its bin directory first on
// PATH, PYTHONHOME removed, then `extra` applied.
process_env_t kernel_process_env(ephemeral_environment const &env,
                                 process_env_t base,
                                 process_env_t const &extra = {});

// Owns one kernel process and the environment it runs in.
//
//   Created -> Launching -> Running -> ShuttingDown -> Terminated
//                        \          \-> Crashed -----/
//                         \-> Crashed -> Terminated      (exit during startup)
//                          \-> Terminated                (timeout, cancel, spawn failure)
//
// Entering Terminated destroys the environment exactly once.
class supervisor : unmovable {
 public:
  using state_observer = std::function<void(kernel_state from, kernel_state to)>;
  using teardown_hook = std::function<void()>;

  supervisor(std::string kernel_name, environment_lease env, supervisor_options opts);
  ~supervisor();

  // Created -> Running. Throws launch_error, after the state has reached Terminated.
  void launch(std::vector<std::string> const &argv,
              process_env_t const &env,
              handshake &hs,
              std::stop_token stop = {});

  // Liveness check while Running. Returns false once the kernel has exited (and the
  // state has reached Terminated).
  bool poll();

  // Graceful stop: SIGTERM, then SIGKILL after the grace period. From Created it simply
  // terminates. No-op once Terminated.
  void stop();

  // Forwards SIGINT to the kernel's process group while Running.
  void interrupt();

  kernel_state state() const { return state_; }
  std::vector<kernel_state> const &history() const { return history_; }
  std::optional<exit_status> const &exit() const { return exit_; }
  std::string const &kernel_name() const { return kernel_name_; }
  std::optional<int> pid() const;

  // Valid until Terminated.
  ephemeral_environment &environment() { return lease_.env(); }
  ephemeral_environment const &environment() const { return lease_.env(); }

  void set_state_observer(state_observer observer) { observer_ = std::move(observer); }

  // Runs on entering Terminated, after the kernel process is gone and before the
  // environment is destroyed. Must not throw.
  void set_teardown_hook(teardown_hook hook) { teardown_ = std::move(hook); }

 private:
  void transition(kernel_state to);
  void terminate();
  void kill_and_reap();
  void finish(exit_status status);

  std::string kernel_name_;
  environment_lease lease_;
  supervisor_options opts_;
  std::unique_ptr<child_process> child_;
  kernel_state state_{ kernel_state::created };
  std::vector<kernel_state> history_{ kernel_state::created };
  std::optional<exit_status> exit_;
  state_observer observer_;
  teardown_hook teardown_;
};

}  // namespace uvk
