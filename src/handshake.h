#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace uvk {

// Startup acknowledgement from a launched kernel. Polled by the supervisor while the
// kernel is Launching.
class handshake {
 public:
  virtual ~handshake() = default;

  virtual bool acknowledged() = 0;
  virtual std::string describe() const = 0;
};

struct connection_info {
  std::string transport;  // "tcp" or "ipc"
  std::string ip;
  int hb_port{ 0 };
};

// Jupyter connection file contents; nullopt when required keys are missing.
std::optional<connection_info> connection_info_parse(std::string_view json);

// The kernel is up once the heartbeat endpoint named in the connection file accepts a
// connection (tcp) or exists (ipc).
class heartbeat_handshake : public handshake {
 public:
  explicit heartbeat_handshake(
      std::filesystem::path connection_file,
      std::chrono::milliseconds connect_timeout = std::chrono::milliseconds{ 200 })
      : connection_file_{ std::move(connection_file) }, connect_timeout_{ connect_timeout } {}

  bool acknowledged() override;
  std::string describe() const override;

 private:
  std::filesystem::path connection_file_;
  std::chrono::milliseconds connect_timeout_;
  std::optional<connection_info> info_;
};

// Acknowledged once `marker` exists.
class file_handshake : public handshake {
 public:
  explicit file_handshake(std::filesystem::path marker) : marker_{ std::move(marker) } {}

  bool acknowledged() override;
  std::string describe() const override { return "marker file " + marker_.string(); }

 private:
  std::filesystem::path marker_;
};

// True if a TCP connection to host:port succeeds within `timeout`.
bool tcp_probe(std::string const &host, int port, std::chrono::milliseconds timeout);

}  // namespace uvk
