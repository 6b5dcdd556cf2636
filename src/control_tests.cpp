#include "control.h"

#include "platform.h"
#include "test_support.h"

#include "doctest.h"

#include <filesystem>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

using strings = std::vector<std::string>;

TEST_CASE("session_info json") {
  uvk::session_info const info{ .kernel_name = "uvk",
                                .root = "/tmp/uvk/env",
                                .python = "/tmp/uvk/env/bin/python",
                                .python_version = "3.12.1",
                                .dependencies = { "ipykernel", "numpy" },
                                .pid = 42,
                                .kernel_pid = 43 };
  auto const parsed{ uvk::session_info_from_json(uvk::session_info_to_json(info)) };
  REQUIRE(parsed.has_value());
  CHECK(parsed->kernel_name == "uvk");
  CHECK(parsed->root == fs::path{ "/tmp/uvk/env" });
  CHECK(parsed->python_version == "3.12.1");
  CHECK(parsed->dependencies == strings{ "ipykernel", "numpy" });
  CHECK(parsed->kernel_pid == 43);

  CHECK_FALSE(uvk::session_info_from_json("{}").has_value());
  CHECK_FALSE(uvk::session_info_from_json("nope").has_value());
}

TEST_CASE("control request and response json") {
  auto const req{ uvk::control_request_from_json(R"({"id": "01-ab", "source": "inline-metadata",
                                                    "specifiers": ["a", "b>1"]})") };
  REQUIRE(req.has_value());
  CHECK(req->id == "01-ab");
  CHECK(req->request.source == uvk::dependency_source::inline_metadata);
  CHECK(req->request.specifiers == strings{ "a", "b>1" });

  CHECK_FALSE(uvk::control_request_from_json(R"({"id": "x", "source": "telepathy",
                                                 "specifiers": []})")
                  .has_value());
  CHECK_FALSE(uvk::control_request_from_json(R"({"id": "x", "source": "live-magic",
                                                 "specifiers": [1]})")
                  .has_value());

  auto const resp{ uvk::control_response_from_json(
      R"({"id": "01-ab", "status": "error", "ename": "MutationError", "evalue": "boom"})") };
  REQUIRE(resp.has_value());
  CHECK_FALSE(resp->ok);
  CHECK(resp->ename == "MutationError");
  CHECK(resp->dependencies.empty());
}

TEST_CASE("control_server lifecycle") {
  uvk::test::temp_dir const scratch{ "control" };
  fs::path dir;
  {
    uvk::control_server server{ scratch / "nested" };
    dir = server.dir();
    CHECK(dir.parent_path() == scratch / "nested");
    CHECK(dir.filename().string().rfind("uvk-session-", 0) == 0);
    CHECK(fs::is_directory(dir / "requests"));
    CHECK(fs::is_directory(dir / "responses"));

    server.publish({ .kernel_name = "k", .root = "/r", .python = "/r/bin/python",
                     .python_version = "3.11.2", .dependencies = { "ipykernel" } });
    uvk::control_client const client{ dir };
    auto const info{ client.read_session() };
    REQUIRE(info.has_value());
    CHECK(info->kernel_name == "k");
  }
  CHECK_FALSE(fs::exists(dir));
}

TEST_CASE("control round trip between client and server") {
  uvk::test::temp_dir const scratch{ "control" };
  uvk::control_server server{ scratch.path() };
  uvk::control_client client{ server.dir() };

  CHECK(server.take_requests().empty());

  auto const first{ client.submit({ .specifiers = { "numpy" } }) };
  auto const second{ client.submit({ .specifiers = { "polars" },
                                     .source = uvk::dependency_source::inline_metadata }) };

  auto const requests{ server.take_requests() };
  REQUIRE(requests.size() == 2);
  CHECK(requests[0].id == first);
  CHECK(requests[0].request.specifiers == strings{ "numpy" });
  CHECK(requests[1].id == second);
  CHECK(requests[1].request.source == uvk::dependency_source::inline_metadata);
  CHECK(server.take_requests().empty());

  std::jthread responder{ [&] {
    std::this_thread::sleep_for(std::chrono::milliseconds{ 50 });
    server.respond({ .id = first, .ok = true, .strategy = "live-patch",
                     .dependencies = { "ipykernel", "numpy" } });
  } };

  auto const resp{ client.wait_response(first, std::chrono::seconds{ 5 },
                                        std::chrono::milliseconds{ 10 }) };
  REQUIRE(resp.has_value());
  CHECK(resp->ok);
  CHECK(resp->strategy == "live-patch");
  CHECK(resp->dependencies == strings{ "ipykernel", "numpy" });
  CHECK(server.response_consumed(first));
}

TEST_CASE("control_client wait_response times out and honours cancellation") {
  uvk::test::temp_dir const scratch{ "control" };
  uvk::control_server server{ scratch.path() };
  uvk::control_client client{ server.dir() };

  CHECK_FALSE(client.wait_response("0001-aa", std::chrono::milliseconds{ 50 },
                                   std::chrono::milliseconds{ 10 })
                  .has_value());

  std::stop_source stop;
  stop.request_stop();
  CHECK_FALSE(client.wait_response("0001-aa", std::chrono::seconds{ 5 },
                                   std::chrono::milliseconds{ 10 }, stop.get_token())
                  .has_value());
}

TEST_CASE("control_server answers malformed requests") {
  uvk::test::temp_dir const scratch{ "control" };
  uvk::control_server server{ scratch.path() };
  uvk::util_write_file(server.dir() / "requests" / "0001-ab.json", "{ garbage");
  uvk::util_write_file(server.dir() / "requests" / ".0002-cd.json.tmp", "{}");

  CHECK(server.take_requests().empty());
  uvk::control_client client{ server.dir() };
  auto const resp{ client.wait_response("0001-ab", std::chrono::seconds{ 1 },
                                        std::chrono::milliseconds{ 10 }) };
  REQUIRE(resp.has_value());
  CHECK_FALSE(resp->ok);
  CHECK(resp->ename == "MalformedRequest");
}

TEST_CASE("control_client::from_environment") {
  auto const saved{ uvk::platform::env_var_get(uvk::kSessionDirEnv) };
  uvk::platform::env_var_unset(uvk::kSessionDirEnv);
  CHECK_FALSE(uvk::control_client::from_environment().has_value());

  uvk::platform::env_var_set(uvk::kSessionDirEnv, "/tmp/uvk/session-x");
  auto const client{ uvk::control_client::from_environment() };
  REQUIRE(client.has_value());
  CHECK(client->dir() == fs::path{ "/tmp/uvk/session-x" });

  if (saved) {
    uvk::platform::env_var_set(uvk::kSessionDirEnv, saved->c_str());
  } else {
    uvk::platform::env_var_unset(uvk::kSessionDirEnv);
  }
}
