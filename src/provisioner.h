#pragma once

#include "env_builder.h"
#include "interpreter.h"
#include "util.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace uvk {

struct ephemeral_environment {
  std::filesystem::path root;
  interpreter_handle interpreter;
  std::vector<std::string> dependencies;  // declared set, in request order
  std::chrono::system_clock::time_point created_at;
  int owner_pid{ 0 };

  std::filesystem::path python() const { return env_python_path(root); }
};

// Creates and destroys ephemeral environments under one scratch directory. Every
// create() yields a root that no earlier call in this process has returned.
class provisioner : unmovable {
 public:
  provisioner(env_builder &builder,
              std::filesystem::path scratch_root,
              std::chrono::milliseconds install_timeout);

  // Throws provision_error with the builder's output attached. On failure nothing is
  // left under the scratch root.
  ephemeral_environment create(interpreter_handle const &interpreter,
                               std::vector<std::string> const &dependencies,
                               std::stop_token stop = {});

  // Idempotent; safe on a never-created or already-removed root. Returns true if this
  // call removed something.
  bool destroy(ephemeral_environment const &env) noexcept;

  env_builder &builder() { return builder_; }
  std::filesystem::path const &scratch_root() const { return scratch_root_; }
  std::chrono::milliseconds install_timeout() const { return install_timeout_; }

  void set_destroy_observer(std::function<void(ephemeral_environment const &)> observer) {
    destroy_observer_ = std::move(observer);
  }

 private:
  env_builder &builder_;
  std::filesystem::path scratch_root_;
  std::chrono::milliseconds install_timeout_;
  std::function<void(ephemeral_environment const &)> destroy_observer_;
};

// Scoped ownership of one environment: release() (or destruction) destroys it exactly once.
class environment_lease : uncopyable {
 public:
  environment_lease() = default;
  environment_lease(provisioner &owner, ephemeral_environment env);
  ~environment_lease();

  environment_lease(environment_lease &&other) noexcept;
  environment_lease &operator=(environment_lease &&other) noexcept;

  explicit operator bool() const { return owner_ != nullptr; }
  ephemeral_environment const &env() const { return env_; }
  ephemeral_environment &env() { return env_; }
  ephemeral_environment const *operator->() const { return &env_; }

  void release() noexcept;

 private:
  provisioner *owner_{ nullptr };
  ephemeral_environment env_;
};

}  // namespace uvk
