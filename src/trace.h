#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace uvk {

namespace trace_events {

struct kernel_state_changed {
  std::string kernel;
  std::string from_state;
  std::string to_state;
};

struct interpreter_resolved {
  std::string selector;
  std::string path;
  std::string version;
  bool installed;
};

struct env_created {
  std::string root;
  std::string interpreter;
  std::int64_t dependency_count;
  std::int64_t duration_ms;
};

struct env_destroyed {
  std::string root;
  bool removed;
};

struct mutation_start {
  std::string root;
  std::string strategy;
  std::string specifiers;
};

struct mutation_complete {
  std::string root;
  std::string strategy;
  bool success;
  bool rolled_back;
  std::int64_t duration_ms;
};

struct registry_op {
  std::string op;
  std::string name;
  std::string kernels_dir;
};

struct command_start {
  std::string command;
  std::string cwd;
};

struct command_complete {
  std::string command;
  int exit_code;
  std::int64_t duration_ms;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::kernel_state_changed,
                                   trace_events::interpreter_resolved,
                                   trace_events::env_created,
                                   trace_events::env_destroyed,
                                   trace_events::mutation_start,
                                   trace_events::mutation_complete,
                                   trace_events::registry_op,
                                   trace_events::command_start,
                                   trace_events::command_complete>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

}  // namespace uvk

#define UVK_TRACE_UNLIKELY [[unlikely]]

#define UVK_TRACE_EMIT(event_expr) \
  do { \
    if (::uvk::tui::g_trace_enabled) UVK_TRACE_UNLIKELY { \
        ::uvk::tui::trace event_expr; \
      } \
  } while (0)

#define UVK_TRACE_KERNEL_STATE_CHANGED(kernel_value, from_value, to_value) \
  UVK_TRACE_EMIT((::uvk::trace_events::kernel_state_changed{ \
      .kernel = (kernel_value), \
      .from_state = (from_value), \
      .to_state = (to_value), \
  }))

#define UVK_TRACE_INTERPRETER_RESOLVED(selector_value, \
                                       path_value, \
                                       version_value, \
                                       installed_value) \
  UVK_TRACE_EMIT((::uvk::trace_events::interpreter_resolved{ \
      .selector = (selector_value), \
      .path = (path_value), \
      .version = (version_value), \
      .installed = (installed_value), \
  }))

#define UVK_TRACE_ENV_CREATED(root_value, interpreter_value, count_value, duration_value) \
  UVK_TRACE_EMIT((::uvk::trace_events::env_created{ \
      .root = (root_value), \
      .interpreter = (interpreter_value), \
      .dependency_count = (count_value), \
      .duration_ms = (duration_value), \
  }))

#define UVK_TRACE_ENV_DESTROYED(root_value, removed_value) \
  UVK_TRACE_EMIT((::uvk::trace_events::env_destroyed{ \
      .root = (root_value), \
      .removed = (removed_value), \
  }))

#define UVK_TRACE_MUTATION_START(root_value, strategy_value, specifiers_value) \
  UVK_TRACE_EMIT((::uvk::trace_events::mutation_start{ \
      .root = (root_value), \
      .strategy = (strategy_value), \
      .specifiers = (specifiers_value), \
  }))

#define UVK_TRACE_MUTATION_COMPLETE(root_value, \
                                    strategy_value, \
                                    success_value, \
                                    rolled_back_value, \
                                    duration_value) \
  UVK_TRACE_EMIT((::uvk::trace_events::mutation_complete{ \
      .root = (root_value), \
      .strategy = (strategy_value), \
      .success = (success_value), \
      .rolled_back = (rolled_back_value), \
      .duration_ms = (duration_value), \
  }))

#define UVK_TRACE_REGISTRY_OP(op_value, name_value, dir_value) \
  UVK_TRACE_EMIT((::uvk::trace_events::registry_op{ \
      .op = (op_value), \
      .name = (name_value), \
      .kernels_dir = (dir_value), \
  }))

#define UVK_TRACE_COMMAND_START(command_value, cwd_value) \
  UVK_TRACE_EMIT((::uvk::trace_events::command_start{ \
      .command = (command_value), \
      .cwd = (cwd_value), \
  }))

#define UVK_TRACE_COMMAND_COMPLETE(command_value, exit_code_value, duration_value) \
  UVK_TRACE_EMIT((::uvk::trace_events::command_complete{ \
      .command = (command_value), \
      .exit_code = (exit_code_value), \
      .duration_ms = (duration_value), \
  }))
