#include "platform.h"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#ifdef __APPLE__
#include <mach-o/dyld.h>
#endif

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace uvk::platform {

// flock() locks belong to the open file description, so two threads of this process that
// each open the lock file exclude each other as well as other processes.
struct file_lock::impl {
  int fd{ -1 };
};

file_lock::file_lock(std::filesystem::path const &path) {
  int const fd{ ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0666) };
  if (fd == -1) {
    throw std::system_error(errno, std::system_category(), "open " + path.string());
  }

  while (::flock(fd, LOCK_EX) == -1) {
    if (errno == EINTR) { continue; }
    int const err{ errno };
    ::close(fd);
    throw std::system_error(err, std::system_category(), "flock " + path.string());
  }

  impl_ = std::make_unique<impl>(impl{ .fd = fd });
}

// The lock file stays behind; unlinking it would let a waiter on the old inode and a newcomer
// on a fresh one both hold "the" lock.
file_lock::~file_lock() {
  if (impl_) { ::close(impl_->fd); }
}

file_lock::file_lock(file_lock &&) noexcept = default;
file_lock &file_lock::operator=(file_lock &&) noexcept = default;

file_lock::operator bool() const { return impl_ != nullptr; }

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to) {
  if (::rename(from.c_str(), to.c_str()) != 0) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to rename " + from.string() + " to " + to.string());
  }
}

bool file_exists(std::filesystem::path const &path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

void write_file_atomic(std::filesystem::path const &path, std::string_view content) {
  auto const tmp{ path.parent_path() /
                  ("." + path.filename().string() + ".tmp-" + util_random_hex(6)) };
  scoped_path_cleanup cleanup{ tmp };

  int const fd{ ::open(tmp.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644) };
  if (fd == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to create " + tmp.string());
  }

  char const *data{ content.data() };
  size_t remaining{ content.size() };
  while (remaining > 0) {
    ssize_t const written{ ::write(fd, data, remaining) };
    if (written == -1) {
      if (errno == EINTR) { continue; }
      int const err{ errno };
      ::close(fd);
      throw std::system_error(err, std::system_category(), "Failed to write " + tmp.string());
    }
    remaining -= static_cast<size_t>(written);
    data += written;
  }

  if (::fsync(fd) == -1) {
    int const err{ errno };
    ::close(fd);
    throw std::system_error(err, std::system_category(), "Failed to fsync " + tmp.string());
  }
  ::close(fd);

  atomic_rename(tmp, path);
  cleanup.release();
}

std::filesystem::path make_unique_dir(std::filesystem::path const &parent,
                                      std::string_view prefix) {
  std::string pattern{ (parent / (std::string{ prefix } + "XXXXXX")).string() };
  std::vector<char> buf{ pattern.begin(), pattern.end() };
  buf.push_back('\0');

  if (::mkdtemp(buf.data()) == nullptr) {
    throw std::system_error(errno,
                            std::system_category(),
                            "mkdtemp failed under " + parent.string());
  }
  return std::filesystem::path{ buf.data() };
}

std::error_code remove_all_with_retry(std::filesystem::path const &target) {
  // On POSIX, file deletion works even with open handles (files get unlinked
  // but data persists until all handles close). No retry needed.
  std::error_code ec;
  std::filesystem::remove_all(target, ec);
  return ec;
}

bool is_executable(std::filesystem::path const &path) {
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) { return false; }
  if (!S_ISREG(st.st_mode)) { return false; }
  return ::access(path.c_str(), X_OK) == 0;
}

std::optional<std::filesystem::path> find_executable(std::string_view name) {
  if (name.empty()) { return std::nullopt; }
  if (name.find('/') != std::string_view::npos) {
    std::filesystem::path const p{ name };
    if (is_executable(p)) { return std::filesystem::absolute(p); }
    return std::nullopt;
  }

  char const *path_env{ std::getenv("PATH") };
  if (!path_env) { return std::nullopt; }

  std::string_view remaining{ path_env };
  while (true) {
    auto const sep{ remaining.find(':') };
    auto const dir{ remaining.substr(0, sep) };
    if (!dir.empty()) {
      auto const candidate{ std::filesystem::path{ dir } / name };
      if (is_executable(candidate)) { return candidate; }
    }
    if (sep == std::string_view::npos) { break; }
    remaining.remove_prefix(sep + 1);
  }
  return std::nullopt;
}

std::filesystem::path get_exe_path() {
#ifdef __APPLE__
  uint32_t size{ 0 };
  _NSGetExecutablePath(nullptr, &size);
  std::vector<char> buf(size);
  if (_NSGetExecutablePath(buf.data(), &size) != 0) {
    throw std::runtime_error("_NSGetExecutablePath failed");
  }
  return std::filesystem::canonical(buf.data());
#else
  std::vector<char> buf(4096);
  ssize_t const len{ ::readlink("/proc/self/exe", buf.data(), buf.size() - 1) };
  if (len == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "readlink /proc/self/exe failed");
  }
  buf[static_cast<size_t>(len)] = '\0';
  return std::filesystem::path{ buf.data() };
#endif
}

int current_pid() { return static_cast<int>(::getpid()); }

std::filesystem::path get_default_scratch_root() {
  if (char const *tmp{ std::getenv("TMPDIR") }; tmp && *tmp) {
    return std::filesystem::path{ tmp } / "uvk";
  }
  return std::filesystem::temp_directory_path() / "uvk";
}

std::optional<std::filesystem::path> get_user_data_dir() {
  if (char const *dir{ std::getenv("JUPYTER_DATA_DIR") }; dir && *dir) {
    return std::filesystem::path{ dir };
  }

#ifdef __APPLE__
  if (char const *home{ std::getenv("HOME") }) {
    return std::filesystem::path{ home } / "Library" / "Jupyter";
  }
#else
  if (char const *xdg{ std::getenv("XDG_DATA_HOME") }; xdg && *xdg) {
    return std::filesystem::path{ xdg } / "jupyter";
  }

  if (char const *home{ std::getenv("HOME") }) {
    return std::filesystem::path{ home } / ".local" / "share" / "jupyter";
  }
#endif

  return std::nullopt;
}

std::filesystem::path get_system_data_dir() { return "/usr/local/share/jupyter"; }

std::filesystem::path get_prefix_data_dir(std::filesystem::path const &prefix) {
  return prefix / "share" / "jupyter";
}

std::vector<std::filesystem::path> get_jupyter_path_entries() {
  std::vector<std::filesystem::path> result;
  char const *jp{ std::getenv("JUPYTER_PATH") };
  if (!jp) { return result; }

  std::string_view remaining{ jp };
  while (true) {
    auto const sep{ remaining.find(':') };
    auto const entry{ remaining.substr(0, sep) };
    if (!entry.empty()) { result.emplace_back(entry); }
    if (sep == std::string_view::npos) { break; }
    remaining.remove_prefix(sep + 1);
  }
  return result;
}

std::vector<std::filesystem::path> get_config_candidates() {
  std::vector<std::filesystem::path> result;
  if (char const *cfg{ std::getenv("UVK_CONFIG") }; cfg && *cfg) {
    result.emplace_back(cfg);
  }
  if (char const *xdg{ std::getenv("XDG_CONFIG_HOME") }; xdg && *xdg) {
    result.push_back(std::filesystem::path{ xdg } / "uvk" / "config.lua");
  }
  if (char const *home{ std::getenv("HOME") }; home && *home) {
    result.push_back(std::filesystem::path{ home } / ".config" / "uvk" / "config.lua");
  }
  return result;
}

void env_var_set(char const *name, char const *value) {
  if (name == nullptr || value == nullptr) {
    throw std::invalid_argument("env_var_set: null name or value");
  }

  if (::setenv(name, value, 1) != 0) {
    throw std::runtime_error(std::string("env_var_set: failed to set ") + name);
  }
}

void env_var_unset(char const *name) {
  if (name == nullptr) { throw std::invalid_argument("env_var_unset: null name"); }
  ::unsetenv(name);
}

std::optional<std::string> env_var_get(char const *name) {
  if (char const *value{ std::getenv(name) }) { return std::string{ value }; }
  return std::nullopt;
}

bool is_tty() { return ::isatty(::fileno(stderr)) != 0; }

}  // namespace uvk::platform
