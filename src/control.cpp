#include "control.h"

#include "platform.h"
#include "tui.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <thread>

namespace uvk {

namespace {

std::atomic<std::uint64_t> s_session_sequence{ 0 };

std::filesystem::path requests_dir(std::filesystem::path const &dir) { return dir / "requests"; }
std::filesystem::path responses_dir(std::filesystem::path const &dir) { return dir / "responses"; }

// Lexicographic order of ids follows submission time.
std::string make_request_id() {
  auto const now{ std::chrono::duration_cast<std::chrono::microseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count() };
  char stamp[32]{};
  std::snprintf(stamp, sizeof stamp, "%020" PRId64, static_cast<std::int64_t>(now));
  return std::string{ stamp } + "-" + util_random_hex(4);
}

bool valid_id(std::string_view id) {
  return !id.empty() && std::all_of(id.begin(), id.end(), [](char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || c == '-';
  });
}

std::optional<dependency_source> source_parse(std::string_view name) {
  if (name == dependency_source_name(dependency_source::live_magic)) {
    return dependency_source::live_magic;
  }
  if (name == dependency_source_name(dependency_source::inline_metadata)) {
    return dependency_source::inline_metadata;
  }
  return std::nullopt;
}

}  // namespace

std::string session_info_to_json(session_info const &info) {
  nlohmann::json doc{
    { "kernel_name", info.kernel_name },
    { "root", info.root.string() },
    { "python", info.python.string() },
    { "python_version", info.python_version },
    { "dependencies", info.dependencies },
    { "pid", info.pid },
    { "kernel_pid", info.kernel_pid },
  };
  return doc.dump(2) + "\n";
}

std::optional<session_info> session_info_from_json(std::string_view json) {
  auto const doc = nlohmann::json::parse(json, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) { return std::nullopt; }
  try {
    return session_info{
      .kernel_name = doc.at("kernel_name").get<std::string>(),
      .root = doc.at("root").get<std::string>(),
      .python = doc.at("python").get<std::string>(),
      .python_version = doc.at("python_version").get<std::string>(),
      .dependencies = doc.at("dependencies").get<std::vector<std::string>>(),
      .pid = doc.value("pid", 0),
      .kernel_pid = doc.value("kernel_pid", 0),
    };
  } catch (nlohmann::json::exception const &) { return std::nullopt; }
}

std::string control_request_to_json(control_request const &req) {
  nlohmann::json doc{
    { "id", req.id },
    { "source", std::string{ dependency_source_name(req.request.source) } },
    { "specifiers", req.request.specifiers },
  };
  return doc.dump() + "\n";
}

std::optional<control_request> control_request_from_json(std::string_view json) {
  auto const doc = nlohmann::json::parse(json, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) { return std::nullopt; }
  try {
    auto const source{ source_parse(doc.at("source").get<std::string>()) };
    if (!source) { return std::nullopt; }
    return control_request{
      .id = doc.at("id").get<std::string>(),
      .request = { .specifiers = doc.at("specifiers").get<std::vector<std::string>>(),
                   .source = *source },
    };
  } catch (nlohmann::json::exception const &) { return std::nullopt; }
}

std::string control_response_to_json(control_response const &resp) {
  nlohmann::json doc{
    { "id", resp.id },
    { "status", resp.ok ? "ok" : "error" },
    { "strategy", resp.strategy },
    { "ename", resp.ename },
    { "evalue", resp.evalue },
    { "dependencies", resp.dependencies },
  };
  return doc.dump() + "\n";
}

std::optional<control_response> control_response_from_json(std::string_view json) {
  auto const doc = nlohmann::json::parse(json, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) { return std::nullopt; }
  try {
    return control_response{
      .id = doc.at("id").get<std::string>(),
      .ok = doc.at("status").get<std::string>() == "ok",
      .strategy = doc.value("strategy", std::string{}),
      .ename = doc.value("ename", std::string{}),
      .evalue = doc.value("evalue", std::string{}),
      .dependencies = doc.value("dependencies", std::vector<std::string>{}),
    };
  } catch (nlohmann::json::exception const &) { return std::nullopt; }
}

control_server::control_server(std::filesystem::path const &scratch_root)
    : dir_{ [&] {
        std::filesystem::create_directories(scratch_root);
        return platform::make_unique_dir(
            scratch_root,
            "uvk-session-" + std::to_string(platform::current_pid()) + "-" +
                std::to_string(s_session_sequence.fetch_add(1)) + "-");
      }() },
      cleanup_{ dir_ } {
  std::filesystem::create_directories(requests_dir(dir_));
  std::filesystem::create_directories(responses_dir(dir_));
}

control_server::~control_server() = default;

void control_server::publish(session_info const &info) {
  platform::write_file_atomic(dir_ / "session.json", session_info_to_json(info));
}

std::vector<control_request> control_server::take_requests() {
  std::vector<std::filesystem::path> files;
  std::error_code ec;
  for (auto const &entry : std::filesystem::directory_iterator{ requests_dir(dir_), ec }) {
    auto const name{ entry.path().filename().string() };
    if (name.starts_with(".") || entry.path().extension() != ".json") { continue; }
    files.push_back(entry.path());
  }
  std::sort(files.begin(), files.end());

  std::vector<control_request> result;
  for (auto const &file : files) {
    std::string text;
    try {
      text = util_load_text(file);
    } catch (std::runtime_error const &e) {
      tui::warn("Cannot read request %s: %s", file.c_str(), e.what());
      continue;
    }
    std::filesystem::remove(file, ec);

    auto req{ control_request_from_json(text) };
    auto const stem{ file.stem().string() };
    if (!req || req->id != stem) {
      tui::warn("Ignoring malformed request %s", file.filename().c_str());
      if (valid_id(stem)) {
        respond({ .id = stem,
                  .ok = false,
                  .ename = "MalformedRequest",
                  .evalue = "The dependency request could not be parsed" });
      }
      continue;
    }
    result.push_back(std::move(*req));
  }
  return result;
}

void control_server::respond(control_response const &resp) {
  if (!valid_id(resp.id)) {
    tui::warn("Not responding to request with invalid id '%s'", resp.id.c_str());
    return;
  }
  platform::write_file_atomic(responses_dir(dir_) / (resp.id + ".json"),
                              control_response_to_json(resp));
}

bool control_server::response_consumed(std::string const &id) const {
  return !platform::file_exists(responses_dir(dir_) / (id + ".json"));
}

std::optional<control_client> control_client::from_environment() {
  auto const dir{ platform::env_var_get(kSessionDirEnv) };
  if (!dir || dir->empty()) { return std::nullopt; }
  return control_client{ *dir };
}

std::optional<session_info> control_client::read_session() const {
  auto const path{ dir_ / "session.json" };
  if (!platform::file_exists(path)) { return std::nullopt; }
  try {
    return session_info_from_json(util_load_text(path));
  } catch (std::runtime_error const &e) {
    tui::debug("Cannot read %s: %s", path.c_str(), e.what());
    return std::nullopt;
  }
}

std::string control_client::submit(dependency_request const &request) {
  auto const id{ make_request_id() };
  platform::write_file_atomic(requests_dir(dir_) / (id + ".json"),
                              control_request_to_json({ .id = id, .request = request }));
  return id;
}

std::optional<control_response> control_client::wait_response(
    std::string const &id,
    std::chrono::milliseconds timeout,
    std::chrono::milliseconds poll_interval,
    std::stop_token stop) {
  auto const path{ responses_dir(dir_) / (id + ".json") };
  auto const deadline{ std::chrono::steady_clock::now() + timeout };

  while (!stop.stop_requested()) {
    if (platform::file_exists(path)) {
      std::optional<control_response> resp;
      try {
        resp = control_response_from_json(util_load_text(path));
      } catch (std::runtime_error const &e) {
        tui::debug("Cannot read %s: %s", path.c_str(), e.what());
      }
      std::error_code ec;
      std::filesystem::remove(path, ec);
      return resp;
    }
    if (std::chrono::steady_clock::now() >= deadline) { break; }
    std::this_thread::sleep_for(poll_interval);
  }
  return std::nullopt;
}

}  // namespace uvk
