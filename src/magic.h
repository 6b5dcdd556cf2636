#pragma once

#include "control.h"
#include "version.h"

#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace uvk {

// %require_python SPEC
struct constraint_check {
  std::string constraint;
};

// %dependencies / %%dependencies
struct dependency_add {
  std::vector<std::string> specifiers;
  bool irregular{ false };  // not one bare specifier per cell line; shown normalized
};

// %%script_metadata
struct metadata_apply {
  std::string source;
};

using magic_command = std::variant<constraint_check, dependency_add, metadata_apply>;

enum magic_form : unsigned { magic_form_line = 1u << 0, magic_form_cell = 1u << 1 };

struct magic_entry {
  std::string_view name;
  unsigned forms;
  magic_command (*parse)(std::string_view args, std::optional<std::string_view> cell);
};

std::span<magic_entry const> magic_table();

// `line` is the magic line including its leading % or %%; `cell` is the cell body for
// the %% form. Throws magic_error ("UsageError") for unknown names and wrong forms.
magic_command magic_parse(std::string_view line, std::optional<std::string_view> cell);

// Markdown notice shown for irregular %%dependencies input.
std::string magic_normalized_notice(std::vector<std::string> const &specifiers);

struct magic_result {
  bool ok{ true };
  std::string ename;
  std::string evalue;
  std::string markdown;
  std::string strategy;  // set when dependencies were routed to the session
};

std::string magic_result_to_json(magic_result const &result);

struct magic_context {
  python_version interpreter;  // of the running kernel's environment
  // Routes a request to the session; nullopt when no response arrived in time.
  std::function<std::optional<control_response>(dependency_request const &)> submit;
};

magic_result magic_execute(magic_command const &cmd, magic_context const &ctx);

// magic_parse + magic_execute; usage errors become error results.
magic_result magic_run(std::string_view line,
                       std::optional<std::string_view> cell,
                       magic_context const &ctx);

}  // namespace uvk
