#include "interpreter.h"

#include "errors.h"
#include "platform.h"
#include "tui.h"
#include "util.h"

#include <string>

namespace uvk {

interpreter_selector interpreter_selector_parse(std::string_view text) {
  auto const trimmed{ util_trim(text) };
  if (!trimmed.empty() &&
      (trimmed.front() == '/' || trimmed.front() == '.' || trimmed.front() == '~')) {
    std::string path{ trimmed };
    if (path.front() == '~') {
      if (auto const home{ platform::env_var_get("HOME") }) { path = *home + path.substr(1); }
    }
    return explicit_path{ std::filesystem::path{ path } };
  }
  return version_constraint{ std::string{ trimmed } };
}

std::string interpreter_selector_describe(interpreter_selector const &selector) {
  return std::visit(match{
                        [](explicit_path const &p) { return p.path.string(); },
                        [](version_constraint const &c) { return c.expression; },
                    },
                    selector);
}

std::string_view interpreter_selector_kind(interpreter_selector const &selector) {
  return std::holds_alternative<explicit_path>(selector) ? "path" : "constraint";
}

interpreter_handle resolver::resolve(interpreter_selector const &selector) {
  return std::visit(
      match{
          [this](explicit_path const &p) { return resolve_path(p); },
          [this](version_constraint const &c) { return resolve_constraint(c); },
      },
      selector);
}

interpreter_handle resolver::resolve_path(explicit_path const &selector) {
  auto const &path{ selector.path };
  if (!platform::file_exists(path)) {
    throw resolution_error("Interpreter not found: " + path.string());
  }
  if (!platform::is_executable(path)) {
    throw resolution_error("Interpreter is not an executable file: " + path.string());
  }
  if (path.filename().string().rfind("python", 0) != 0) {
    throw resolution_error("Not a Python interpreter: " + path.string());
  }

  auto const version{ source_.query_version(path) };
  if (!version) {
    throw resolution_error("Cannot determine the version of interpreter " + path.string());
  }

  UVK_TRACE_INTERPRETER_RESOLVED(path.string(), path.string(), version->str(), false);
  return { .path = path, .version = *version };
}

interpreter_handle resolver::resolve_constraint(version_constraint const &selector) {
  auto const specs{ specifier_set::parse(selector.expression) };

  auto const pick{ [&]() -> std::optional<interpreter_handle> {
    auto const installed{ source_.list_installed() };
    std::optional<installed_interpreter> best;
    for (auto const &candidate : installed) {
      if (!specs.contains(candidate.version)) { continue; }
      if (!best || candidate.version > best->version) { best = candidate; }
    }
    if (!best) { return std::nullopt; }
    return interpreter_handle{ .path = best->path, .version = best->version };
  } };

  if (auto const found{ pick() }) {
    tui::debug("Python %s satisfies '%s': %s",
               found->version.str().c_str(),
               specs.text().c_str(),
               found->path.string().c_str());
    UVK_TRACE_INTERPRETER_RESOLVED(specs.text(),
                                   found->path.string(),
                                   found->version.str(),
                                   false);
    return *found;
  }

  tui::info("No installed Python satisfies '%s'; installing one", specs.text().c_str());
  if (auto const installed{ source_.install(specs) }; !installed.success) {
    throw resolution_error("No Python interpreter satisfies '" + specs.text() +
                           "' and installation failed:\n" + installed.output);
  }

  if (auto const found{ pick() }) {
    UVK_TRACE_INTERPRETER_RESOLVED(specs.text(),
                                   found->path.string(),
                                   found->version.str(),
                                   true);
    return *found;
  }

  throw resolution_error("No Python interpreter satisfies '" + specs.text() + "'");
}

}  // namespace uvk
