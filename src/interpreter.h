#pragma once

#include "env_builder.h"
#include "version.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace uvk {

struct explicit_path {
  std::filesystem::path path;
};

struct version_constraint {
  std::string expression;
};

using interpreter_selector = std::variant<explicit_path, version_constraint>;

// Paths (starting with '/', '.' or '~') select an interpreter directly; anything else is a
// version constraint.
interpreter_selector interpreter_selector_parse(std::string_view text);
std::string interpreter_selector_describe(interpreter_selector const &selector);
std::string_view interpreter_selector_kind(interpreter_selector const &selector);

struct interpreter_handle {
  std::filesystem::path path;
  python_version version;
};

struct installed_interpreter {
  std::filesystem::path path;
  python_version version;
};

// Where interpreters come from: what is installed, how to install more, and how to ask an
// interpreter binary for its version.
class interpreter_source {
 public:
  virtual ~interpreter_source() = default;

  virtual std::vector<installed_interpreter> list_installed() = 0;
  virtual build_result install(specifier_set const &constraint) = 0;
  virtual std::optional<python_version> query_version(std::filesystem::path const &path) = 0;
};

class resolver {
 public:
  explicit resolver(interpreter_source &source) : source_{ source } {}

  // Throws resolution_error, or invalid_specifier_error for an unparsable constraint.
  interpreter_handle resolve(interpreter_selector const &selector);

 private:
  interpreter_handle resolve_path(explicit_path const &selector);
  interpreter_handle resolve_constraint(version_constraint const &selector);

  interpreter_source &source_;
};

}  // namespace uvk
