#include "handshake.h"

#include "platform.h"
#include "tui.h"
#include "util.h"

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include <cerrno>
#include <memory>

namespace uvk {

namespace {

struct addrinfo_deleter {
  void operator()(addrinfo *ai) const noexcept { ::freeaddrinfo(ai); }
};

bool connect_one(addrinfo const &ai, std::chrono::milliseconds timeout) {
  int const fd{ ::socket(ai.ai_family, ai.ai_socktype, ai.ai_protocol) };
  if (fd == -1) { return false; }
  if (::fcntl(fd, F_SETFD, FD_CLOEXEC) == -1 ||
      ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK) == -1) {
    ::close(fd);
    return false;
  }

  bool connected{ false };
  if (::connect(fd, ai.ai_addr, ai.ai_addrlen) == 0) {
    connected = true;
  } else if (errno == EINPROGRESS) {
    pollfd pfd{ .fd = fd, .events = POLLOUT, .revents = 0 };
    int rc;
    do {
      rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while (rc == -1 && errno == EINTR);

    if (rc == 1) {
      int err{ 0 };
      socklen_t len{ sizeof err };
      connected = ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err == 0;
    }
  }
  ::close(fd);
  return connected;
}

}  // namespace

std::optional<connection_info> connection_info_parse(std::string_view json) {
  auto const doc = nlohmann::json::parse(json, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) { return std::nullopt; }

  try {
    connection_info info{ .transport = doc.value("transport", std::string{ "tcp" }),
                          .ip = doc.at("ip").get<std::string>(),
                          .hb_port = doc.at("hb_port").get<int>() };
    if (info.transport != "tcp" && info.transport != "ipc") { return std::nullopt; }
    return info;
  } catch (nlohmann::json::exception const &) { return std::nullopt; }
}

bool tcp_probe(std::string const &host, int port, std::chrono::milliseconds timeout) {
  std::string const target{ (host.empty() || host == "0.0.0.0" || host == "*") ? "127.0.0.1"
                                                                                : host };
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo *raw{ nullptr };
  if (::getaddrinfo(target.c_str(), std::to_string(port).c_str(), &hints, &raw) != 0) {
    return false;
  }
  std::unique_ptr<addrinfo, addrinfo_deleter> const list{ raw };

  for (addrinfo const *ai{ list.get() }; ai; ai = ai->ai_next) {
    if (connect_one(*ai, timeout)) { return true; }
  }
  return false;
}

bool heartbeat_handshake::acknowledged() {
  if (!info_) {
    if (!platform::file_exists(connection_file_)) { return false; }
    std::string text;
    try {
      text = util_load_text(connection_file_);
    } catch (std::runtime_error const &e) {
      tui::debug("Connection file not readable yet: %s", e.what());
      return false;
    }
    info_ = connection_info_parse(text);
    if (!info_) {
      tui::debug("Connection file %s is not usable yet", connection_file_.c_str());
      return false;
    }
  }

  if (info_->transport == "ipc") {
    return platform::file_exists(info_->ip + "-" + std::to_string(info_->hb_port));
  }
  return tcp_probe(info_->ip, info_->hb_port, connect_timeout_);
}

std::string heartbeat_handshake::describe() const {
  return "heartbeat from connection file " + connection_file_.string();
}

bool file_handshake::acknowledged() { return platform::file_exists(marker_); }

}  // namespace uvk
