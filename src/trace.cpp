#include "trace.h"

#include "util.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

namespace uvk {

namespace {

using fields_t = nlohmann::ordered_json;

// Each event's payload in declaration order. Keys are shared by the text and JSON forms.
fields_t fields(trace_events::kernel_state_changed const &e) {
  return { { "kernel", e.kernel }, { "from", e.from_state }, { "to", e.to_state } };
}

fields_t fields(trace_events::interpreter_resolved const &e) {
  return { { "selector", e.selector },
           { "path", e.path },
           { "version", e.version },
           { "installed", e.installed } };
}

fields_t fields(trace_events::env_created const &e) {
  return { { "root", e.root },
           { "interpreter", e.interpreter },
           { "dependency_count", e.dependency_count },
           { "duration_ms", e.duration_ms } };
}

fields_t fields(trace_events::env_destroyed const &e) {
  return { { "root", e.root }, { "removed", e.removed } };
}

fields_t fields(trace_events::mutation_start const &e) {
  return { { "root", e.root }, { "strategy", e.strategy }, { "specifiers", e.specifiers } };
}

fields_t fields(trace_events::mutation_complete const &e) {
  return { { "root", e.root },
           { "strategy", e.strategy },
           { "success", e.success },
           { "rolled_back", e.rolled_back },
           { "duration_ms", e.duration_ms } };
}

fields_t fields(trace_events::registry_op const &e) {
  return { { "op", e.op }, { "name", e.name }, { "kernels_dir", e.kernels_dir } };
}

fields_t fields(trace_events::command_start const &e) {
  return { { "command", e.command }, { "cwd", e.cwd } };
}

fields_t fields(trace_events::command_complete const &e) {
  return { { "command", e.command },
           { "exit_code", e.exit_code },
           { "duration_ms", e.duration_ms } };
}

fields_t event_fields(trace_event_t const &event) {
  return std::visit([](auto const &e) { return fields(e); }, event);
}

std::string dump(fields_t const &value) {
  return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// UTC, millisecond precision: 2026-01-31T12:00:00.123Z
std::string iso8601_now() {
  auto const now{ std::chrono::system_clock::now() };
  auto const ms{ std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch())
                     .count() %
                 1000 };
  std::time_t const secs{ std::chrono::system_clock::to_time_t(now) };
  std::tm utc{};
  gmtime_r(&secs, &utc);

  char stamp[32]{};
  if (std::strftime(stamp, sizeof stamp, "%Y-%m-%dT%H:%M:%S", &utc) == 0) { return {}; }

  char out[40]{};
  std::snprintf(out, sizeof out, "%s.%03dZ", stamp, static_cast<int>(ms));
  return out;
}

}  // namespace

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(
      match{
          [](trace_events::kernel_state_changed const &) { return "kernel_state_changed"; },
          [](trace_events::interpreter_resolved const &) { return "interpreter_resolved"; },
          [](trace_events::env_created const &) { return "env_created"; },
          [](trace_events::env_destroyed const &) { return "env_destroyed"; },
          [](trace_events::mutation_start const &) { return "mutation_start"; },
          [](trace_events::mutation_complete const &) { return "mutation_complete"; },
          [](trace_events::registry_op const &) { return "registry_op"; },
          [](trace_events::command_start const &) { return "command_start"; },
          [](trace_events::command_complete const &) { return "command_complete"; },
      },
      event);
}

std::string trace_event_to_string(trace_event_t const &event) {
  std::string out{ trace_event_name(event) };
  fields_t const payload = event_fields(event);
  for (auto const &[key, value] : payload.items()) {
    out += ' ';
    out += key;
    out += '=';
    out += value.is_string() ? value.get<std::string>() : dump(value);
  }
  return out;
}

std::string trace_event_to_json(trace_event_t const &event) {
  fields_t record{ { "ts", iso8601_now() },
                   { "event", std::string{ trace_event_name(event) } } };
  record.update(event_fields(event));
  return dump(record);
}

}  // namespace uvk
