#pragma once

#include "errors.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace uvk {

// Dependency specifiers of one metadata block. Iterating never consumes it; every
// begin() starts again from the first specifier.
class dependency_range {
 public:
  using const_iterator = std::vector<std::string>::const_iterator;

  dependency_range() = default;
  explicit dependency_range(std::vector<std::string> specifiers)
      : specifiers_{ std::make_shared<std::vector<std::string> const>(std::move(specifiers)) } {}

  const_iterator begin() const {
    return specifiers_ ? specifiers_->begin() : no_specifiers().begin();
  }
  const_iterator end() const { return specifiers_ ? specifiers_->end() : no_specifiers().end(); }
  std::size_t size() const { return specifiers_ ? specifiers_->size() : 0; }
  bool empty() const { return size() == 0; }

  std::vector<std::string> to_vector() const { return { begin(), end() }; }

 private:
  static std::vector<std::string> const &no_specifiers();

  std::shared_ptr<std::vector<std::string> const> specifiers_;
};

struct metadata_parse_result {
  dependency_range dependencies;
  std::optional<std::string> requires_python;
  bool found_block{ false };
  bool trailing_lines{ false };          // comment lines after the closing line, ignored
  std::optional<metadata_error> error;   // set => nothing else in the result is usable
};

// Whitespace-separated specifiers, as written after %dependencies.
std::vector<std::string> parse_dependencies(std::string_view text);

// Inline script metadata:
//
//   # /// script
//   # requires-python = ">=3.11"
//   # dependencies = ["numpy", "polars>=1"]
//   # ///
//
// Never throws for malformed input. No block yields an empty result without error; two
// blocks, a missing closing line, invalid TOML or mistyped keys yield `error`.
metadata_parse_result parse_script_metadata(std::string_view source);

}  // namespace uvk
