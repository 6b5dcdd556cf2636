#include "session.h"

#include "errors.h"
#include "platform.h"
#include "tui.h"

#include <cstdlib>
#include <exception>
#include <memory>
#include <system_error>
#include <thread>
#include <utility>

namespace uvk {

kernel_session::kernel_session(config const &cfg,
                               provisioner &prov,
                               interpreter_source &interpreters,
                               session_params params,
                               session_hooks hooks)
    : cfg_{ cfg },
      prov_{ prov },
      resolver_{ interpreters },
      params_{ std::move(params) },
      hooks_{ std::move(hooks) },
      control_{ prov.scratch_root() },
      mutations_{ prov, cfg.policy } {
  if (!hooks_.make_handshake) {
    hooks_.make_handshake = [](ephemeral_environment const &, std::filesystem::path const &c) {
      return std::make_unique<heartbeat_handshake>(c);
    };
  }
  if (!hooks_.make_argv) { hooks_.make_argv = kernel_argv; }
}

kernel_session::~kernel_session() {
  drain_mutation();
  sup_.reset();
}

void kernel_session::start(std::stop_token stop) {
  auto const handle{ resolver_.resolve(params_.python) };
  auto env{ prov_.create(handle, params_.dependencies, stop) };
  start_kernel(environment_lease{ prov_, std::move(env) }, stop);
}

void kernel_session::start_kernel(environment_lease lease, std::stop_token stop) {
  supervisor_options const opts{ .handshake_timeout = cfg_.handshake_timeout,
                                 .grace_period = cfg_.grace_period,
                                 .poll_interval = cfg_.poll_interval };
  sup_ = std::make_unique<supervisor>(params_.kernel_name, std::move(lease), opts);
  sup_->set_teardown_hook([this] { drain_mutation(); });

  auto const &env{ sup_->environment() };
  auto hs{ hooks_.make_handshake(env, params_.connection_file) };
  auto const argv{ hooks_.make_argv(env, params_.connection_file) };
  auto const process_env{ kernel_process_env(env,
                                             process_getenv(),
                                             { { kSessionDirEnv, control_.dir().string() } }) };

  publish();
  sup_->launch(argv, process_env, *hs, stop);
  publish();
}

void kernel_session::publish() {
  if (!sup_) { return; }
  auto const &env{ sup_->environment() };
  try {
    control_.publish({ .kernel_name = params_.kernel_name,
                       .root = env.root,
                       .python = env.python(),
                       .python_version = env.interpreter.version.str(),
                       .dependencies = env.dependencies,
                       .pid = platform::current_pid(),
                       .kernel_pid = sup_->pid().value_or(0) });
  } catch (std::system_error const &e) {
    tui::warn("Cannot publish session state: %s", e.what());
  }
}

int kernel_session::run(std::stop_token stop, std::function<int()> const &take_interrupts) {
  if (!sup_) { throw launch_error("Kernel session was not started"); }

  bool stopped{ false };
  while (true) {
    if (stop.stop_requested()) {
      stopped = true;
      drain_mutation();
      sup_->stop();
      break;
    }
    if (take_interrupts && take_interrupts() > 0) { sup_->interrupt(); }

    enqueue(control_.take_requests());
    complete_mutation();

    if (!sup_->poll()) { break; }
    std::this_thread::sleep_for(cfg_.poll_interval);
  }

  drain_mutation();
  {
    std::lock_guard lock{ finished_mutex_ };
    if (finished_) { queue_.push_front(std::move(finished_->request)); }
    finished_.reset();
  }
  for (auto const &req : queue_) {
    control_.respond({ .id = req.id,
                       .ok = false,
                       .ename = "KernelExited",
                       .evalue = "The kernel exited before the request was applied" });
  }
  queue_.clear();

  if (stopped) { return 0; }
  auto const &status{ sup_->exit() };
  if (!status) { return EXIT_FAILURE; }
  if (status->signal) { return 128 + *status->signal; }
  return status->exit_code;
}

void kernel_session::enqueue(std::vector<control_request> requests) {
  for (auto &req : requests) {
    tui::info("Dependency request %s: %s",
              req.id.c_str(),
              util_join(req.request.specifiers, " ").c_str());
    queue_.push_back(std::move(req));
  }
  if (!mutation_running_) { start_next_mutation(); }
}

void kernel_session::start_next_mutation() {
  if (queue_.empty()) { return; }

  auto request{ std::move(queue_.front()) };
  queue_.pop_front();
  mutation_running_ = true;
  {
    std::lock_guard lock{ finished_mutex_ };
    mutation_in_flight_ = true;
    mutation_stop_ = std::stop_source{};
  }

  worker_.enqueue([this,
                   request = std::move(request),
                   snapshot = sup_->environment(),
                   stop = mutation_stop_.get_token()] {
    auto env{ snapshot };
    finished_mutation done{ .request = request };
    try {
      done.outcome = mutations_.apply(env, request.request, stop);
    } catch (mutation_error const &e) {
      std::string evalue{ e.what() };
      if (!e.cause().empty()) { evalue += "\n" + e.cause(); }
      done.failure = { .id = request.id,
                       .ok = false,
                       .ename = "MutationError",
                       .evalue = std::move(evalue) };
    } catch (std::exception const &e) {
      done.failure = { .id = request.id, .ok = false, .ename = "Error", .evalue = e.what() };
    }

    std::lock_guard lock{ finished_mutex_ };
    finished_ = std::move(done);
    mutation_in_flight_ = false;
    mutation_idle_.notify_all();
  });
}

// Cancels the running mutation, if any, and waits for its body to return. Its result stays
// in `finished_`.
void kernel_session::drain_mutation() {
  std::unique_lock lock{ finished_mutex_ };
  if (!mutation_in_flight_) { return; }
  mutation_stop_.request_stop();
  mutation_idle_.wait(lock, [this] { return !mutation_in_flight_; });
}

void kernel_session::complete_mutation() {
  std::optional<finished_mutation> done;
  {
    std::lock_guard lock{ finished_mutex_ };
    done.swap(finished_);
  }
  if (!done) { return; }
  mutation_running_ = false;

  if (!done->outcome) {
    tui::error("Dependency request %s failed: %s",
               done->request.id.c_str(),
               done->failure.evalue.c_str());
    control_.respond(done->failure);
    start_next_mutation();
    return;
  }

  auto &outcome{ *done->outcome };
  control_response const resp{
    .id = done->request.id,
    .ok = true,
    .strategy = std::string{ mutation_strategy_name(outcome.strategy) },
    .dependencies = outcome.dependencies,
  };

  if (outcome.strategy != mutation_strategy::rebuild) {
    sup_->environment().dependencies = outcome.dependencies;
    publish();
    control_.respond(resp);
    start_next_mutation();
    return;
  }

  tui::info("Restarting kernel %s in rebuilt environment %s",
            params_.kernel_name.c_str(),
            outcome.replacement->root.c_str());
  control_.respond(resp);
  wait_for_pickup(resp.id);

  sup_->stop();
  ++restarts_;
  start_kernel(std::move(outcome.replacement), {});
  start_next_mutation();
}

// The requesting code runs inside the kernel about to be replaced; give it the chance to
// read its response first.
void kernel_session::wait_for_pickup(std::string const &id) {
  auto const deadline{ std::chrono::steady_clock::now() + cfg_.grace_period };
  while (!control_.response_consumed(id) && std::chrono::steady_clock::now() < deadline) {
    if (!sup_->poll()) { return; }
    std::this_thread::sleep_for(cfg_.poll_interval);
  }
}

}  // namespace uvk
