#pragma once

#include "config.h"
#include "control.h"
#include "handshake.h"
#include "interpreter.h"
#include "mutation.h"
#include "provisioner.h"
#include "supervisor.h"
#include "util.h"

#include "tbb/task_arena.h"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace uvk {

struct session_params {
  std::string kernel_name;
  interpreter_selector python;
  std::vector<std::string> dependencies;
  std::filesystem::path connection_file;
};

// Replaceable pieces of a kernel launch. Defaults: heartbeat_handshake on the connection
// file and kernel_argv.
struct session_hooks {
  std::function<std::unique_ptr<handshake>(ephemeral_environment const &,
                                           std::filesystem::path const &connection_file)>
      make_handshake;
  std::function<std::vector<std::string>(ephemeral_environment const &,
                                         std::filesystem::path const &connection_file)>
      make_argv;
};

// One `uvk launch`: resolves the interpreter once, provisions the environment, runs the
// kernel under a supervisor and serves dependency requests from the control channel.
// Mutations run one at a time on a dedicated arena so liveness polling continues while
// they install; the environment is never destroyed under a running mutation.
class kernel_session : unmovable {
 public:
  kernel_session(config const &cfg,
                 provisioner &prov,
                 interpreter_source &interpreters,
                 session_params params,
                 session_hooks hooks = {});
  ~kernel_session();

  // Throws resolution_error, provision_error or launch_error; nothing is left behind.
  void start(std::stop_token stop = {});

  // Until the kernel exits or `stop` is requested. Returns the kernel's exit status as a
  // process exit code (0 after a requested stop). Throws launch_error if a restart after
  // a rebuild fails.
  int run(std::stop_token stop, std::function<int()> const &take_interrupts = {});

  supervisor const *current() const { return sup_.get(); }
  control_server const &control() const { return control_; }
  std::size_t restarts() const { return restarts_; }

 private:
  struct finished_mutation {
    control_request request;
    std::optional<mutation_outcome> outcome;
    control_response failure;
  };

  void start_kernel(environment_lease lease, std::stop_token stop);
  void publish();
  void enqueue(std::vector<control_request> requests);
  void start_next_mutation();
  void complete_mutation();
  void drain_mutation();
  void wait_for_pickup(std::string const &id);

  config const &cfg_;
  provisioner &prov_;
  resolver resolver_;
  session_params params_;
  session_hooks hooks_;
  control_server control_;
  mutation_handler mutations_;
  std::unique_ptr<supervisor> sup_;
  std::size_t restarts_{ 0 };

  std::deque<control_request> queue_;
  bool mutation_running_{ false };  // started and not yet completed on the polling thread

  std::mutex finished_mutex_;
  std::condition_variable mutation_idle_;
  bool mutation_in_flight_{ false };  // worker body has not returned yet
  std::optional<finished_mutation> finished_;
  std::stop_source mutation_stop_;

  // One slot, none reserved for the caller: enqueued work gets a worker thread even when
  // the process may use a single CPU.
  tbb::task_arena worker_{ 1, 0 };
};

}  // namespace uvk
