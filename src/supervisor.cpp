#include "supervisor.h"

#include "errors.h"
#include "trace.h"
#include "tui.h"

#include <algorithm>
#include <csignal>
#include <system_error>
#include <thread>

namespace uvk {

namespace {

std::string describe_exit(exit_status const &status) {
  if (status.signal) { return "signal " + std::to_string(*status.signal); }
  return "exit code " + std::to_string(status.exit_code);
}

}  // namespace

std::string_view kernel_state_name(kernel_state state) {
  switch (state) {
    case kernel_state::created: return "created";
    case kernel_state::launching: return "launching";
    case kernel_state::running: return "running";
    case kernel_state::shutting_down: return "shutting_down";
    case kernel_state::crashed: return "crashed";
    case kernel_state::terminated: return "terminated";
  }
  return "unknown";
}

std::vector<std::string> kernel_argv(ephemeral_environment const &env,
                                     std::filesystem::path const &connection_file) {
  return { env.python().string(), "-m", "ipykernel_launcher", "-f", connection_file.string() };
}

process_env_t kernel_process_env(ephemeral_environment const &env,
                                 process_env_t base,
                                 process_env_t const &extra) {
  auto const bin{ (env.root / "bin").string() };
  auto const path_it{ base.find("PATH") };
  base["PATH"] = (path_it == base.end() || path_it->second.empty())
                     ? bin
                     : bin + ":" + path_it->second;
  base["VIRTUAL_ENV"] = env.root.string();
  base.erase("PYTHONHOME");
  for (auto const &[key, value] : extra) { base[key] = value; }
  return base;
}

supervisor::supervisor(std::string kernel_name, environment_lease env, supervisor_options opts)
    : kernel_name_{ std::move(kernel_name) }, lease_{ std::move(env) }, opts_{ opts } {}

supervisor::~supervisor() {
  if (state_ != kernel_state::terminated) {
    try {
      stop();
    } catch (std::exception const &e) {
      tui::error("Kernel %s teardown failed: %s", kernel_name_.c_str(), e.what());
      lease_.release();
    }
  }
}

std::optional<int> supervisor::pid() const {
  if (!child_) { return std::nullopt; }
  return child_->pid();
}

void supervisor::transition(kernel_state to) {
  auto const from{ state_ };
  state_ = to;
  history_.push_back(to);
  tui::debug("Kernel %s: %s -> %s",
             kernel_name_.c_str(),
             std::string{ kernel_state_name(from) }.c_str(),
             std::string{ kernel_state_name(to) }.c_str());
  UVK_TRACE_KERNEL_STATE_CHANGED(kernel_name_,
                                 std::string{ kernel_state_name(from) },
                                 std::string{ kernel_state_name(to) });
  if (observer_) { observer_(from, to); }
}

void supervisor::terminate() {
  child_.reset();
  if (teardown_) { teardown_(); }
  transition(kernel_state::terminated);
  lease_.release();
}

void supervisor::kill_and_reap() {
  if (!child_) { return; }
  child_->send_signal(SIGKILL);
  if (auto const status{ child_->wait_for(opts_.grace_period) }) { exit_ = *status; }
}

void supervisor::finish(exit_status status) {
  exit_ = status;
  if (status.clean()) {
    tui::info("Kernel %s shut down", kernel_name_.c_str());
    transition(kernel_state::shutting_down);
  } else {
    tui::error("Kernel %s crashed (%s)", kernel_name_.c_str(), describe_exit(status).c_str());
    transition(kernel_state::crashed);
  }
  terminate();
}

void supervisor::launch(std::vector<std::string> const &argv,
                        process_env_t const &env,
                        handshake &hs,
                        std::stop_token stop) {
  if (state_ != kernel_state::created) {
    throw launch_error("Kernel " + kernel_name_ + " was already launched");
  }
  transition(kernel_state::launching);

  if (stop.stop_requested()) {
    terminate();
    throw launch_error("Kernel " + kernel_name_ + " launch cancelled");
  }

  try {
    child_ = child_process::spawn({ .argv = argv, .cwd = std::nullopt, .env = env });
  } catch (std::system_error const &e) {
    terminate();
    throw launch_error("Cannot start kernel " + kernel_name_ + ": " + e.what());
  }
  tui::debug("Kernel %s started: pid %d: %s",
             kernel_name_.c_str(),
             child_->pid(),
             process_format_argv(argv).c_str());

  auto const deadline{ std::chrono::steady_clock::now() + opts_.handshake_timeout };
  while (true) {
    if (auto const status{ child_->try_wait() }) {
      exit_ = *status;
      child_.reset();
      transition(kernel_state::crashed);
      terminate();
      throw launch_error("Kernel " + kernel_name_ + " exited during startup (" +
                         describe_exit(*status) + ")");
    }

    if (hs.acknowledged()) {
      transition(kernel_state::running);
      tui::info("Kernel %s is running (%s)", kernel_name_.c_str(), hs.describe().c_str());
      return;
    }

    if (stop.stop_requested()) {
      kill_and_reap();
      terminate();
      throw launch_error("Kernel " + kernel_name_ + " launch cancelled");
    }

    auto const now{ std::chrono::steady_clock::now() };
    if (now >= deadline) {
      kill_and_reap();
      terminate();
      throw launch_error("Kernel " + kernel_name_ + " did not complete its handshake (" +
                         hs.describe() + ") within " +
                         std::to_string(opts_.handshake_timeout.count()) + " ms");
    }

    auto const remaining{
      std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now)
    };
    std::this_thread::sleep_for(std::min(opts_.poll_interval, remaining));
  }
}

bool supervisor::poll() {
  if (state_ != kernel_state::running) { return false; }
  auto const status{ child_->try_wait() };
  if (!status) { return true; }
  finish(*status);
  return false;
}

void supervisor::stop() {
  switch (state_) {
    case kernel_state::terminated: return;
    case kernel_state::running: break;
    default:
      kill_and_reap();
      terminate();
      return;
  }

  if (auto const status{ child_->try_wait() }) {
    finish(*status);
    return;
  }

  transition(kernel_state::shutting_down);
  tui::info("Stopping kernel %s", kernel_name_.c_str());
  child_->send_signal(SIGTERM);
  auto status{ child_->wait_for(opts_.grace_period) };
  if (!status) {
    tui::warn("Kernel %s ignored SIGTERM for %lld ms; killing it",
              kernel_name_.c_str(),
              static_cast<long long>(opts_.grace_period.count()));
    child_->send_signal(SIGKILL);
    status = child_->wait_for(opts_.grace_period);
  }
  if (status) { exit_ = *status; }
  terminate();
}

void supervisor::interrupt() {
  if (state_ != kernel_state::running || !child_) { return; }
  tui::debug("Interrupting kernel %s", kernel_name_.c_str());
  child_->send_signal(SIGINT);
}

}  // namespace uvk
