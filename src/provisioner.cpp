#include "provisioner.h"

#include "errors.h"
#include "platform.h"
#include "trace.h"
#include "tui.h"

#include <cstdint>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

namespace uvk {

namespace {

std::atomic<std::uint64_t> s_env_sequence{ 0 };

}  // namespace

provisioner::provisioner(env_builder &builder,
                         std::filesystem::path scratch_root,
                         std::chrono::milliseconds install_timeout)
    : builder_{ builder },
      scratch_root_{ std::move(scratch_root) },
      install_timeout_{ install_timeout } {}

ephemeral_environment provisioner::create(interpreter_handle const &interpreter,
                                          std::vector<std::string> const &dependencies,
                                          std::stop_token stop) {
  auto const start{ std::chrono::steady_clock::now() };

  std::error_code ec;
  std::filesystem::create_directories(scratch_root_, ec);
  if (ec) {
    throw provision_error("Cannot create scratch directory " + scratch_root_.string(),
                          ec.message());
  }

  int const pid{ platform::current_pid() };
  std::string const prefix{ "uvk-" + std::to_string(pid) + "-" +
                            std::to_string(s_env_sequence.fetch_add(1)) + "-" };

  std::filesystem::path root;
  try {
    root = platform::make_unique_dir(scratch_root_, prefix);
  } catch (std::system_error const &e) {
    throw provision_error("Cannot allocate environment root under " + scratch_root_.string(),
                          e.what());
  }
  scoped_path_cleanup cleanup{ root };

  tui::info("Creating environment %s with Python %s",
            root.string().c_str(),
            interpreter.version.str().c_str());

  auto const result{ builder_.build(interpreter.path,
                                    root,
                                    dependencies,
                                    { .timeout = install_timeout_, .stop = stop }) };
  if (!result.success) {
    std::string reason{ "Failed to build environment " + root.string() };
    if (result.timed_out) { reason += " (timed out)"; }
    if (result.cancelled) { reason += " (cancelled)"; }
    throw provision_error(reason, result.output);
  }

  ephemeral_environment env{ .root = root,
                             .interpreter = interpreter,
                             .dependencies = dependencies,
                             .created_at = std::chrono::system_clock::now(),
                             .owner_pid = pid };

  if (!platform::is_executable(env.python())) {
    throw provision_error("Environment " + root.string() + " has no executable interpreter",
                          env.python().string() + " is missing or not executable");
  }

  cleanup.release();

  auto const duration_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - start)
                              .count() };
  UVK_TRACE_ENV_CREATED(root.string(),
                        interpreter.path.string(),
                        static_cast<std::int64_t>(dependencies.size()),
                        static_cast<std::int64_t>(duration_ms));
  return env;
}

bool provisioner::destroy(ephemeral_environment const &env) noexcept {
  if (env.root.empty()) { return false; }

  bool removed{ false };
  try {
    bool const existed{ platform::file_exists(env.root) };
    if (auto const ec{ platform::remove_all_with_retry(env.root) }) {
      tui::warn("Failed to remove environment %s: %s",
                env.root.string().c_str(),
                ec.message().c_str());
    } else {
      removed = existed;
    }

    if (removed) { tui::debug("Removed environment %s", env.root.string().c_str()); }
    UVK_TRACE_ENV_DESTROYED(env.root.string(), removed);
    if (destroy_observer_) { destroy_observer_(env); }
  } catch (std::exception const &e) {
    tui::error("Environment teardown failed for %s: %s", env.root.string().c_str(), e.what());
  }
  return removed;
}

environment_lease::environment_lease(provisioner &owner, ephemeral_environment env)
    : owner_{ &owner }, env_{ std::move(env) } {}

environment_lease::~environment_lease() { release(); }

environment_lease::environment_lease(environment_lease &&other) noexcept
    : owner_{ std::exchange(other.owner_, nullptr) }, env_{ std::move(other.env_) } {}

environment_lease &environment_lease::operator=(environment_lease &&other) noexcept {
  if (this != &other) {
    release();
    owner_ = std::exchange(other.owner_, nullptr);
    env_ = std::move(other.env_);
  }
  return *this;
}

void environment_lease::release() noexcept {
  if (auto *const owner{ std::exchange(owner_, nullptr) }) { owner->destroy(env_); }
}

}  // namespace uvk
