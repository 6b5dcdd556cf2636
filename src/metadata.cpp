#include "metadata.h"

#include "tui.h"
#include "util.h"

#include <toml.hpp>

#include <exception>
#include <sstream>

namespace uvk {

namespace {

constexpr std::string_view kOpenLine{ "# /// script" };
constexpr std::string_view kCloseLine{ "# ///" };

metadata_parse_result failed(std::string message) {
  metadata_parse_result result;
  result.found_block = true;
  result.error = metadata_error{ message };
  return result;
}

}  // namespace

std::vector<std::string> const &dependency_range::no_specifiers() {
  static std::vector<std::string> const kEmpty;
  return kEmpty;
}

std::vector<std::string> parse_dependencies(std::string_view text) {
  return util_split_whitespace(text);
}

metadata_parse_result parse_script_metadata(std::string_view source) {
  enum class state { before, inside, after } st{ state::before };

  std::string toml_text;
  bool trailing{ false };

  for (auto const raw : util_split_lines(source)) {
    auto const line{ util_trim(raw) };
    switch (st) {
      case state::before:
        if (line == kOpenLine) { st = state::inside; }
        break;

      case state::inside:
        if (line == kCloseLine) {
          st = state::after;
        } else if (line == "#") {
          toml_text += '\n';
        } else if (line.starts_with("# ")) {
          toml_text.append(line.substr(2));
          toml_text += '\n';
        }
        break;

      case state::after:
        if (line == kOpenLine) {
          return failed("Found more than one script metadata block; none of them was applied");
        }
        if (line.starts_with("# ")) { trailing = true; }
        break;
    }
  }

  if (st == state::before) { return {}; }
  if (st == state::inside) {
    return failed("Cannot find the script metadata closing line `# ///`");
  }

  if (trailing) {
    tui::warn("The script metadata has trailing lines after the closing line `# ///`; "
              "these are ignored");
  }

  toml::value data;
  try {
    std::istringstream stream{ toml_text };
    data = toml::parse(stream, "script metadata");
  } catch (std::exception const &e) {
    return failed(std::string{ "Invalid TOML in script metadata: " } + e.what());
  }

  metadata_parse_result result;
  result.found_block = true;
  result.trailing_lines = trailing;

  if (data.contains("requires-python")) {
    auto const &rp{ data.at("requires-python") };
    if (!rp.is_string()) { return failed("Script metadata `requires-python` must be a string"); }
    result.requires_python = toml::get<std::string>(rp);
  }

  if (data.contains("dependencies")) {
    auto const &deps{ data.at("dependencies") };
    if (!deps.is_array()) {
      return failed("Script metadata `dependencies` must be an array of strings");
    }

    std::vector<std::string> specifiers;
    for (auto const &entry : deps.as_array()) {
      if (!entry.is_string()) {
        return failed("Script metadata `dependencies` must contain only strings");
      }
      specifiers.push_back(toml::get<std::string>(entry));
    }
    result.dependencies = dependency_range{ std::move(specifiers) };
  }

  return result;
}

}  // namespace uvk
