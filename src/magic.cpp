#include "magic.h"

#include "errors.h"
#include "metadata.h"
#include "tui.h"
#include "util.h"

#include <nlohmann/json.hpp>

#include <array>

namespace uvk {

namespace {

magic_command parse_require_python(std::string_view args, std::optional<std::string_view>) {
  return constraint_check{ std::string{ util_trim(args) } };
}

magic_command parse_dependencies_magic(std::string_view args,
                                       std::optional<std::string_view> cell) {
  dependency_add cmd{ .specifiers = parse_dependencies(args) };
  if (!cell) { return cmd; }

  cmd.irregular = !cmd.specifiers.empty();
  for (auto const line : util_split_lines(*cell)) {
    if (util_trim(line).empty()) { continue; }
    auto tokens{ parse_dependencies(line) };
    if (tokens.size() != 1 || tokens.front() != line) { cmd.irregular = true; }
    for (auto &t : tokens) { cmd.specifiers.push_back(std::move(t)); }
  }
  return cmd;
}

magic_command parse_script_metadata_magic(std::string_view,
                                          std::optional<std::string_view> cell) {
  return metadata_apply{ std::string{ cell.value_or(std::string_view{}) } };
}

constexpr std::array<magic_entry, 3> kMagicTable{ {
    { "require_python", magic_form_line, parse_require_python },
    { "dependencies", magic_form_line | magic_form_cell, parse_dependencies_magic },
    { "script_metadata", magic_form_cell, parse_script_metadata_magic },
} };

magic_result error_result(std::string ename, std::string evalue) {
  return { .ok = false, .ename = std::move(ename), .evalue = std::move(evalue) };
}

magic_result check_constraint(std::string_view constraint, python_version const &current) {
  specifier_set specs;
  try {
    specs = specifier_set::parse(constraint);
  } catch (invalid_specifier_error const &e) { return error_result("InvalidSpecifier", e.what()); }

  if (!specs.contains(current)) {
    return error_result("PythonRequirementNotSatisfied",
                        "Python " + current.str() + " does not satisfy " + specs.text());
  }
  return {};
}

magic_result route_dependencies(std::vector<std::string> specifiers,
                                dependency_source source,
                                magic_context const &ctx) {
  if (specifiers.empty()) {
    return { .strategy = std::string{ mutation_strategy_name(mutation_strategy::none) } };
  }
  if (!ctx.submit) { return error_result("NoSession", "No uvk session is serving this kernel"); }

  auto const resp{ ctx.submit({ .specifiers = std::move(specifiers), .source = source }) };
  if (!resp) {
    return error_result("Timeout", "The session did not answer the dependency request in time");
  }
  if (!resp->ok) { return error_result(resp->ename, resp->evalue); }
  return { .strategy = resp->strategy };
}

}  // namespace

std::span<magic_entry const> magic_table() { return kMagicTable; }

magic_command magic_parse(std::string_view line, std::optional<std::string_view> cell) {
  line = util_trim(line);
  bool const cell_form{ line.starts_with("%%") };
  if (cell_form) {
    line.remove_prefix(2);
  } else if (line.starts_with("%")) {
    line.remove_prefix(1);
  } else {
    throw magic_error("UsageError", "Not a magic command: " + std::string{ line });
  }

  auto const end_of_name{ line.find_first_of(" \t") };
  auto const name{ line.substr(0, end_of_name) };
  auto const args{ end_of_name == std::string_view::npos ? std::string_view{}
                                                         : line.substr(end_of_name + 1) };

  for (auto const &entry : kMagicTable) {
    if (entry.name != name) { continue; }
    unsigned const form{ cell_form ? magic_form_cell : magic_form_line };
    if (!(entry.forms & form)) {
      throw magic_error("UsageError",
                        std::string{ cell_form ? "%%" : "%" } + std::string{ name } +
                            " is not available as a " + (cell_form ? "cell" : "line") +
                            " magic");
    }
    if (!cell_form && cell) {
      throw magic_error("UsageError", "%" + std::string{ name } + " takes no cell body");
    }
    std::optional<std::string_view> body;
    if (cell_form) { body = cell.value_or(std::string_view{}); }
    return entry.parse(args, body);
  }
  throw magic_error("UsageError", "Unknown magic: " + std::string{ name });
}

std::string magic_normalized_notice(std::vector<std::string> const &specifiers) {
  std::string md{
    "Requirement specifications are irregular. They will be processed as if they had been "
    "supplied in the following form:\n\n```\n%%dependencies\n"
  };
  for (auto const &s : specifiers) { md += s + "\n"; }
  md += "```";
  return md;
}

std::string magic_result_to_json(magic_result const &result) {
  nlohmann::json doc{
    { "status", result.ok ? "ok" : "error" },
    { "ename", result.ename },
    { "evalue", result.evalue },
    { "markdown", result.markdown },
    { "strategy", result.strategy },
  };
  return doc.dump();
}

magic_result magic_execute(magic_command const &cmd, magic_context const &ctx) {
  return std::visit(
      match{
          [&](constraint_check const &c) {
            return check_constraint(c.constraint, ctx.interpreter);
          },

          [&](dependency_add const &d) {
            auto result{ route_dependencies(d.specifiers, dependency_source::live_magic, ctx) };
            if (d.irregular) { result.markdown = magic_normalized_notice(d.specifiers); }
            return result;
          },

          [&](metadata_apply const &m) {
            auto const parsed{ parse_script_metadata(m.source) };
            if (parsed.error) { return error_result("MetadataError", parsed.error->what()); }
            if (!parsed.found_block) {
              return error_result("MetadataError",
                                  "The cell holds no `# /// script` metadata block");
            }
            if (parsed.requires_python) {
              auto check{ check_constraint(*parsed.requires_python, ctx.interpreter) };
              if (!check.ok) { return check; }
            }
            return route_dependencies(parsed.dependencies.to_vector(),
                                      dependency_source::inline_metadata,
                                      ctx);
          },
      },
      cmd);
}

magic_result magic_run(std::string_view line,
                       std::optional<std::string_view> cell,
                       magic_context const &ctx) {
  try {
    auto const cmd{ magic_parse(line, cell) };
    return magic_execute(cmd, ctx);
  } catch (magic_error const &e) {
    tui::debug("magic: %s", e.what());
    return error_result(e.ename(), e.what());
  }
}

}  // namespace uvk
