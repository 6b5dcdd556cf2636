#pragma once

#include "mutation.h"
#include "util.h"

#include <chrono>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace uvk {

// What `uvk launch` publishes about its current environment in session.json.
struct session_info {
  std::string kernel_name;
  std::filesystem::path root;
  std::filesystem::path python;
  std::string python_version;
  std::vector<std::string> dependencies;
  int pid{ 0 };         // uvk launch
  int kernel_pid{ 0 };  // 0 while no kernel is running
};

struct control_request {
  std::string id;
  dependency_request request;
};

struct control_response {
  std::string id;
  bool ok{ false };
  std::string strategy;  // mutation_strategy_name
  std::string ename;
  std::string evalue;
  std::vector<std::string> dependencies;
};

std::string session_info_to_json(session_info const &info);
std::optional<session_info> session_info_from_json(std::string_view json);
std::string control_request_to_json(control_request const &req);
std::optional<control_request> control_request_from_json(std::string_view json);
std::string control_response_to_json(control_response const &resp);
std::optional<control_response> control_response_from_json(std::string_view json);

// Name of the environment variable pointing the kernel (and `uvk magic`) at the session.
inline constexpr char kSessionDirEnv[]{ "UVK_SESSION_DIR" };

// Server side of the session directory, owned by `uvk launch`:
//
//   <dir>/session.json     single writer: this object
//   <dir>/requests/<id>.json
//   <dir>/responses/<id>.json
//
// Every file is published by rename, so readers never see a partial document. The
// directory is removed on destruction.
class control_server : unmovable {
 public:
  explicit control_server(std::filesystem::path const &scratch_root);
  ~control_server();

  std::filesystem::path const &dir() const { return dir_; }

  void publish(session_info const &info);

  // Pending requests, oldest first. Each is removed from the queue; malformed ones are
  // answered with an error response and skipped.
  std::vector<control_request> take_requests();

  void respond(control_response const &resp);

  // True once the client has picked up (removed) the response for `id`.
  bool response_consumed(std::string const &id) const;

 private:
  std::filesystem::path dir_;
  scoped_path_cleanup cleanup_;
};

// Client side, used from inside the kernel.
class control_client {
 public:
  explicit control_client(std::filesystem::path dir) : dir_{ std::move(dir) } {}

  // Reads $UVK_SESSION_DIR; nullopt when not running under `uvk launch`.
  static std::optional<control_client> from_environment();

  std::optional<session_info> read_session() const;

  // Queues `request`; returns its id. Throws std::system_error on I/O failure.
  std::string submit(dependency_request const &request);

  // Waits for and consumes the response to `id`. nullopt on timeout or cancellation.
  std::optional<control_response> wait_response(std::string const &id,
                                                std::chrono::milliseconds timeout,
                                                std::chrono::milliseconds poll_interval,
                                                std::stop_token stop = {});

  std::filesystem::path const &dir() const { return dir_; }

 private:
  std::filesystem::path dir_;
};

}  // namespace uvk
