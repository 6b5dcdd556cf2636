#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace uvk {

// Interpreter version: up to three release components plus an optional a/b/rc
// pre-release. Ordering is delegated to semver.
struct python_version {
  enum class pre_kind { none, alpha, beta, rc };

  int major{ 0 };
  int minor{ 0 };
  int patch{ 0 };
  int release_size{ 3 };  // components actually written in the source text
  pre_kind pre{ pre_kind::none };
  int pre_number{ 0 };

  // Accepts "3", "3.11", "3.11.2", "3.13.0rc1", "3.14.0a3" (case-insensitive, a local
  // "+..." suffix is ignored). Returns nullopt for anything else.
  static std::optional<python_version> parse(std::string_view text);

  bool is_prerelease() const { return pre != pre_kind::none; }
  std::string str() const;     // canonical PEP 440 form, always three components
  std::string series() const;  // "3.11"

  friend bool operator<(python_version const &a, python_version const &b);
  friend bool operator==(python_version const &a, python_version const &b);
  friend bool operator!=(python_version const &a, python_version const &b) { return !(a == b); }
  friend bool operator>(python_version const &a, python_version const &b) { return b < a; }
  friend bool operator<=(python_version const &a, python_version const &b) { return !(b < a); }
  friend bool operator>=(python_version const &a, python_version const &b) { return !(a < b); }
};

// Subset of PEP 440 version specifiers: == != >= <= > < ~= === and ==X.Y.* / !=X.Y.*,
// comma-separated. A bare version is shorthand: "3.11" means "==3.11.*" and "3.11.4"
// means "==3.11.4".
class specifier_set {
 public:
  enum class op { eq, ne, ge, le, gt, lt, compatible, arbitrary };

  struct clause {
    op oper;
    python_version version;
    std::string text;  // version text as written, used by ===
    bool wildcard{ false };
  };

  // Throws invalid_specifier_error.
  static specifier_set parse(std::string_view text);

  // Pre-releases only match when some clause names a pre-release.
  bool contains(python_version const &v) const;

  bool names_prerelease() const;
  std::vector<clause> const &clauses() const { return clauses_; }
  std::string const &text() const { return text_; }

 private:
  std::vector<clause> clauses_;
  std::string text_;
};

// Highest candidate satisfying `specs`; nullopt if none does.
std::optional<python_version> select_highest(std::vector<python_version> const &candidates,
                                             specifier_set const &specs);

}  // namespace uvk
