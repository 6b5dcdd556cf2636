#if defined(_WIN32)
#error "process_posix.cpp should not be compiled on Windows builds"
#else

#include "process.h"

#include "platform.h"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace uvk {
namespace {

constexpr int kChildErrorExit{ 127 };
constexpr int kSignalExitBase{ 128 };
constexpr int kPollSliceMs{ 50 };

class fd_cleanup {
 public:
  explicit fd_cleanup(int fd) : fd_{ fd } {}
  ~fd_cleanup() {
    if (fd_ == -1) { return; }
    close_with_retry();
  }

  fd_cleanup(fd_cleanup const &) = delete;
  fd_cleanup &operator=(fd_cleanup const &) = delete;
  fd_cleanup(fd_cleanup &&other) noexcept : fd_{ other.fd_ } { other.fd_ = -1; }

  int get() const { return fd_; }

  void release() {
    if (fd_ == -1) { return; }
    close_with_retry();
    fd_ = -1;
  }

 private:
  void close_with_retry() {
    for (int attempts{ 0 }; attempts < 3 && ::close(fd_) == -1; ++attempts) {
      if (errno != EINTR) { break; }
    }
  }

  int fd_{ -1 };
};

std::pair<fd_cleanup, fd_cleanup> make_pipe() {
  int fds[2];
  if (::pipe(fds) == -1) {
    throw std::system_error(errno, std::generic_category(), "pipe failed");
  }
  ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
  ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
  return { fd_cleanup{ fds[0] }, fd_cleanup{ fds[1] } };
}

exit_status decode_status(int status) {
  if (WIFEXITED(status)) { return { .exit_code = WEXITSTATUS(status), .signal = std::nullopt }; }

  if (WIFSIGNALED(status)) {
    int const sig{ WTERMSIG(status) };
    return { .exit_code = kSignalExitBase + sig, .signal = sig };
  }

  return { .exit_code = status, .signal = std::nullopt };
}

exit_status wait_for_child(pid_t child) {
  int status{ 0 };
  while (true) {
    pid_t const result = ::waitpid(child, &status, 0);
    if (result == -1 && errno == EINTR) { continue; }
    if (result == -1) {
      throw std::system_error(errno, std::generic_category(), "waitpid failed");
    }
    break;
  }
  return decode_status(status);
}

struct exec_plan {
  std::vector<std::string> argv_strings;
  std::vector<char *> argv;
  std::vector<std::string> env_strings;
  std::vector<char *> envp;
  bool use_environ{ true };
};

exec_plan make_exec_plan(std::vector<std::string> argv_strings,
                         std::optional<process_env_t> const &env) {
  exec_plan plan;
  plan.argv_strings = std::move(argv_strings);
  plan.argv.reserve(plan.argv_strings.size() + 1);
  for (auto &arg : plan.argv_strings) { plan.argv.push_back(arg.data()); }
  plan.argv.push_back(nullptr);

  if (env) {
    plan.use_environ = false;
    plan.env_strings.reserve(env->size());
    for (auto const &[key, value] : *env) { plan.env_strings.push_back(key + "=" + value); }
    for (auto &entry : plan.env_strings) { plan.envp.push_back(entry.data()); }
    plan.envp.push_back(nullptr);
  }
  return plan;
}

// Async-signal-safe from here on: only syscalls until execve or _exit.
[[noreturn]] void exec_child(exec_plan const &plan,
                             std::optional<std::filesystem::path> const &cwd,
                             int error_fd) {
  ::setpgid(0, 0);

  // The parent may have blocked or ignored these; a kernel must see them.
  struct sigaction sa{};
  sa.sa_handler = SIG_DFL;
  sigemptyset(&sa.sa_mask);
  ::sigaction(SIGINT, &sa, nullptr);
  ::sigaction(SIGTERM, &sa, nullptr);

  auto const report_and_exit{ [error_fd]() {
    int const err{ errno };
    [[maybe_unused]] auto const n{ ::write(error_fd, &err, sizeof err) };
    _exit(kChildErrorExit);
  } };

  if (cwd && ::chdir(cwd->c_str()) == -1) { report_and_exit(); }

  char *const *envp{ plan.use_environ ? environ
                                      : const_cast<char *const *>(plan.envp.data()) };
  ::execve(plan.argv_strings[0].c_str(), plan.argv.data(), envp);
  report_and_exit();
  UVK_UNREACHABLE();
}

// Returns the errno the child reported before exec, or 0 once exec succeeded.
int read_exec_error(fd_cleanup &error_read) {
  int child_errno{ 0 };
  while (true) {
    ssize_t const n{ ::read(error_read.get(), &child_errno, sizeof child_errno) };
    if (n == -1 && errno == EINTR) { continue; }
    if (n == static_cast<ssize_t>(sizeof child_errno)) { return child_errno; }
    return 0;
  }
}

std::optional<std::string> resolve_executable(std::string const &name) {
  auto const found{ platform::find_executable(name) };
  if (!found) { return std::nullopt; }
  return found->string();
}

void kill_group(pid_t pid, int sig) {
  if (::kill(-pid, sig) == -1 && errno == ESRCH) { ::kill(pid, sig); }
}

}  // namespace

process_env_t process_getenv() {
  process_env_t env;
  if (!environ) { return env; }

  for (char **entry{ environ }; *entry != nullptr; ++entry) {
    std::string_view kv{ *entry };
    size_t const sep{ kv.find('=') };
    if (sep == std::string_view::npos) { continue; }
    env[std::string{ kv.substr(0, sep) }] = std::string{ kv.substr(sep + 1) };
  }

  return env;
}

std::string process_format_argv(std::vector<std::string> const &argv) {
  std::string out;
  for (auto const &arg : argv) {
    if (!out.empty()) { out.push_back(' '); }
    bool const needs_quotes{ arg.empty() || arg.find_first_of(" \t\"'") != std::string::npos };
    if (needs_quotes) {
      out.push_back('\'');
      out.append(arg);
      out.push_back('\'');
    } else {
      out.append(arg);
    }
  }
  return out;
}

process_result process_run(std::vector<std::string> const &argv, process_run_cfg const &cfg) {
  if (argv.empty()) { throw std::invalid_argument("process_run: argv must be non-empty"); }

  process_result result;

  auto const exe{ resolve_executable(argv[0]) };
  if (!exe) {
    result.exit_code = kChildErrorExit;
    result.launch_failed = true;
    result.output = argv[0] + ": executable not found";
    return result;
  }

  auto argv_strings{ argv };
  argv_strings[0] = *exe;
  auto const plan{ make_exec_plan(std::move(argv_strings), cfg.env) };

  auto [out_read, out_write]{ make_pipe() };
  auto [err_read, err_write]{ make_pipe() };

  pid_t const child{ ::fork() };
  if (child == -1) { throw std::system_error(errno, std::generic_category(), "fork failed"); }

  if (child == 0) {
    int const null_fd{ ::open("/dev/null", O_RDONLY) };
    if (null_fd == -1 || ::dup2(null_fd, STDIN_FILENO) == -1 ||
        ::dup2(out_write.get(), STDOUT_FILENO) == -1 ||
        (cfg.merge_stderr && ::dup2(out_write.get(), STDERR_FILENO) == -1)) {
      _exit(kChildErrorExit);
    }
    exec_child(plan, cfg.cwd, err_write.get());
  }

  static_cast<void>(::setpgid(child, child));  // also done in the child; first one wins
  out_write.release();
  err_write.release();

  if (int const child_errno{ read_exec_error(err_read) }; child_errno != 0) {
    wait_for_child(child);
    result.exit_code = kChildErrorExit;
    result.launch_failed = true;
    result.output = argv[0] + ": " + std::strerror(child_errno);
    return result;
  }

  auto const deadline{ cfg.timeout ? std::optional{ std::chrono::steady_clock::now() +
                                                    *cfg.timeout }
                                   : std::nullopt };

  std::string pending;
  std::string chunk(4096, '\0');
  auto const emit_line{ [&](std::string const &line) {
    if (cfg.on_output_line) { cfg.on_output_line(line); }
  } };

  try {
    pollfd pfd{ .fd = out_read.get(), .events = POLLIN, .revents = 0 };
    bool killed{ false };
    while (true) {
      if (!killed) {
        if (cfg.stop.stop_requested()) {
          result.cancelled = true;
        } else if (deadline && std::chrono::steady_clock::now() >= *deadline) {
          result.timed_out = true;
        }
        if (result.cancelled || result.timed_out) {
          kill_group(child, SIGKILL);
          killed = true;
        }
      }

      int const poll_result{ ::poll(&pfd, 1, kPollSliceMs) };
      if (poll_result == -1) {
        if (errno == EINTR) { continue; }
        throw std::system_error(errno, std::generic_category(), "poll failed");
      }
      if (poll_result == 0) { continue; }

      ssize_t const read_bytes{ ::read(out_read.get(), chunk.data(), chunk.size()) };
      if (read_bytes == -1) {
        if (errno == EINTR) { continue; }
        throw std::system_error(errno, std::generic_category(), "read failed");
      }
      if (read_bytes == 0) { break; }

      result.output.append(chunk.data(), static_cast<size_t>(read_bytes));
      pending.append(chunk.data(), static_cast<size_t>(read_bytes));

      size_t newline{ 0 };
      while ((newline = pending.find('\n')) != std::string::npos) {
        emit_line(pending.substr(0, newline));
        pending.erase(0, newline + 1);
      }
    }
    if (!pending.empty()) { emit_line(pending); }

    auto const status{ wait_for_child(child) };
    result.exit_code = status.exit_code;
    result.signal = status.signal;
  } catch (...) {
    kill_group(child, SIGKILL);
    wait_for_child(child);
    throw;
  }

  return result;
}

std::unique_ptr<child_process> child_process::spawn(cfg const &config) {
  if (config.argv.empty()) {
    throw std::invalid_argument("child_process::spawn: argv must be non-empty");
  }

  auto const exe{ resolve_executable(config.argv[0]) };
  if (!exe) {
    throw std::system_error(std::make_error_code(std::errc::no_such_file_or_directory),
                            "executable not found: " + config.argv[0]);
  }

  auto argv_strings{ config.argv };
  argv_strings[0] = *exe;
  auto const plan{ make_exec_plan(std::move(argv_strings), config.env) };

  auto [err_read, err_write]{ make_pipe() };

  pid_t const child{ ::fork() };
  if (child == -1) { throw std::system_error(errno, std::generic_category(), "fork failed"); }

  if (child == 0) { exec_child(plan, config.cwd, err_write.get()); }

  static_cast<void>(::setpgid(child, child));
  err_write.release();

  if (int const child_errno{ read_exec_error(err_read) }; child_errno != 0) {
    wait_for_child(child);
    throw std::system_error(child_errno,
                            std::generic_category(),
                            "failed to start " + config.argv[0]);
  }

  return std::unique_ptr<child_process>{ new child_process{ child } };
}

child_process::~child_process() {
  if (status_) { return; }
  kill_group(pid_, SIGKILL);
  try {
    wait_for_child(pid_);
  } catch (std::system_error const &) {
    // already reaped elsewhere; nothing left to release
  }
}

std::optional<exit_status> child_process::try_wait() {
  if (status_) { return status_; }

  int status{ 0 };
  while (true) {
    pid_t const r{ ::waitpid(pid_, &status, WNOHANG) };
    if (r == -1 && errno == EINTR) { continue; }
    if (r == -1) { throw std::system_error(errno, std::generic_category(), "waitpid failed"); }
    if (r == 0) { return std::nullopt; }
    break;
  }

  status_ = decode_status(status);
  return status_;
}

std::optional<exit_status> child_process::wait_for(std::chrono::milliseconds timeout) {
  auto const deadline{ std::chrono::steady_clock::now() + timeout };
  while (true) {
    if (auto const status{ try_wait() }) { return status; }
    if (std::chrono::steady_clock::now() >= deadline) { return std::nullopt; }
    std::this_thread::sleep_for(std::chrono::milliseconds{ 10 });
  }
}

void child_process::send_signal(int sig) {
  if (status_) { return; }
  kill_group(pid_, sig);
}

}  // namespace uvk

#endif  // POSIX implementation
