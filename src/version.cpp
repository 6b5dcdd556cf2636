#include "version.h"

#include "errors.h"
#include "util.h"

#include "semver.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <stdexcept>
#include <string>
#include <string_view>

namespace uvk {

namespace {

bool parse_int(std::string_view s, int &out) {
  if (s.empty() || s.size() > 6) { return false; }
  auto const [ptr, ec]{ std::from_chars(s.data(), s.data() + s.size(), out) };
  return ec == std::errc{} && ptr == s.data() + s.size();
}

semver::version<> to_semver(python_version const &v) {
  std::string text{ std::to_string(v.major) + "." + std::to_string(v.minor) + "." +
                    std::to_string(v.patch) };
  switch (v.pre) {
    case python_version::pre_kind::none: break;
    case python_version::pre_kind::alpha:
      text += "-alpha." + std::to_string(v.pre_number);
      break;
    case python_version::pre_kind::beta:
      text += "-beta." + std::to_string(v.pre_number);
      break;
    case python_version::pre_kind::rc: text += "-rc." + std::to_string(v.pre_number); break;
  }

  semver::version<> result;
  if (!semver::parse(text, result)) {
    throw std::logic_error("python_version: not representable as semver: " + text);
  }
  return result;
}

std::array<int, 3> release(python_version const &v) { return { v.major, v.minor, v.patch }; }

// True if the first `count` release components of `v` equal those of `prefix`.
bool release_prefix_matches(python_version const &v, python_version const &prefix, int count) {
  auto const a{ release(v) };
  auto const b{ release(prefix) };
  for (int i{ 0 }; i < count; ++i) {
    if (a[i] != b[i]) { return false; }
  }
  return true;
}

bool clause_matches(specifier_set::clause const &c, python_version const &v) {
  using op = specifier_set::op;
  switch (c.oper) {
    case op::eq:
      if (c.wildcard) { return release_prefix_matches(v, c.version, c.version.release_size); }
      return v == c.version;
    case op::ne:
      if (c.wildcard) { return !release_prefix_matches(v, c.version, c.version.release_size); }
      return v != c.version;
    case op::ge: return v >= c.version;
    case op::le: return v <= c.version;
    case op::gt: return v > c.version;
    case op::lt:
      // "<3.12" excludes 3.12.0rc1 even though it sorts lower.
      if (v.is_prerelease() && !c.version.is_prerelease() && release(v) == release(c.version)) {
        return false;
      }
      return v < c.version;
    case op::compatible:
      return v >= c.version &&
             release_prefix_matches(v, c.version, c.version.release_size - 1);
    case op::arbitrary: return v.str() == c.text;
  }
  return false;
}

struct op_token {
  std::string_view token;
  specifier_set::op oper;
};

constexpr std::array<op_token, 8> kOperators{ {
    { "===", specifier_set::op::arbitrary },
    { "~=", specifier_set::op::compatible },
    { "==", specifier_set::op::eq },
    { "!=", specifier_set::op::ne },
    { ">=", specifier_set::op::ge },
    { "<=", specifier_set::op::le },
    { ">", specifier_set::op::gt },
    { "<", specifier_set::op::lt },
} };

specifier_set::clause parse_clause(std::string_view raw, std::string_view whole) {
  auto const fail{ [&](char const *why) -> specifier_set::clause {
    throw invalid_specifier_error("Invalid version specifier '" + std::string{ whole } +
                                  "': " + why);
  } };

  auto text{ util_trim(raw) };
  if (text.empty()) { return fail("empty clause"); }

  specifier_set::clause c{ .oper = specifier_set::op::eq, .version = {}, .text = {} };
  bool has_operator{ false };
  for (auto const &candidate : kOperators) {
    if (text.substr(0, candidate.token.size()) == candidate.token) {
      c.oper = candidate.oper;
      text.remove_prefix(candidate.token.size());
      has_operator = true;
      break;
    }
  }

  text = util_trim(text);
  if (text.empty()) { return fail("missing version"); }
  c.text = std::string{ text };

  if (c.oper == specifier_set::op::arbitrary) {
    auto const parsed{ python_version::parse(text) };
    if (!parsed) { return fail("unrecognized version"); }
    c.version = *parsed;
    return c;
  }

  if (text.size() >= 2 && text.substr(text.size() - 2) == ".*") {
    if (c.oper != specifier_set::op::eq && c.oper != specifier_set::op::ne) {
      return fail("wildcard only allowed with == or !=");
    }
    c.wildcard = true;
    text.remove_suffix(2);
  }

  auto const parsed{ python_version::parse(text) };
  if (!parsed) { return fail("unrecognized version"); }
  c.version = *parsed;

  if (c.wildcard && c.version.is_prerelease()) {
    return fail("wildcard cannot follow a pre-release");
  }

  if (c.oper == specifier_set::op::compatible && c.version.release_size < 2) {
    return fail("~= requires at least two release components");
  }

  if (!has_operator && !c.version.is_prerelease() && c.version.release_size < 3) {
    c.wildcard = true;
  }

  return c;
}

}  // namespace

std::optional<python_version> python_version::parse(std::string_view text) {
  text = util_trim(text);
  if (auto const plus{ text.find('+') }; plus != std::string_view::npos) {
    text = text.substr(0, plus);
  }
  if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) {
    return std::nullopt;
  }

  python_version v;

  size_t pos{ 0 };
  std::array<int, 3> parts{ 0, 0, 0 };
  int count{ 0 };
  while (true) {
    size_t end{ pos };
    while (end < text.size() && std::isdigit(static_cast<unsigned char>(text[end]))) { ++end; }
    if (end == pos || count == 3) { return std::nullopt; }
    if (!parse_int(text.substr(pos, end - pos), parts[static_cast<size_t>(count)])) {
      return std::nullopt;
    }
    ++count;
    pos = end;
    if (pos < text.size() && text[pos] == '.' && pos + 1 < text.size() &&
        std::isdigit(static_cast<unsigned char>(text[pos + 1]))) {
      ++pos;
      continue;
    }
    break;
  }

  v.major = parts[0];
  v.minor = parts[1];
  v.patch = parts[2];
  v.release_size = count;

  if (pos == text.size()) { return v; }

  std::string suffix;
  for (char const ch : text.substr(pos)) {
    suffix.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }
  if (!suffix.empty() && (suffix.front() == '-' || suffix.front() == '.')) {
    suffix.erase(0, 1);
  }

  std::string_view rest{ suffix };
  struct tag {
    std::string_view text;
    pre_kind kind;
  };
  constexpr std::array<tag, 6> kTags{ { { "alpha", pre_kind::alpha },
                                        { "beta", pre_kind::beta },
                                        { "rc", pre_kind::rc },
                                        { "c", pre_kind::rc },
                                        { "a", pre_kind::alpha },
                                        { "b", pre_kind::beta } } };
  bool matched{ false };
  for (auto const &t : kTags) {
    if (rest.substr(0, t.text.size()) == t.text) {
      v.pre = t.kind;
      rest.remove_prefix(t.text.size());
      matched = true;
      break;
    }
  }
  if (!matched) { return std::nullopt; }

  if (!rest.empty() && (rest.front() == '.' || rest.front() == '-')) { rest.remove_prefix(1); }
  if (rest.empty()) { return v; }
  if (!parse_int(rest, v.pre_number)) { return std::nullopt; }
  return v;
}

std::string python_version::str() const {
  std::string out{ std::to_string(major) + "." + std::to_string(minor) + "." +
                   std::to_string(patch) };
  switch (pre) {
    case pre_kind::none: break;
    case pre_kind::alpha: out += "a" + std::to_string(pre_number); break;
    case pre_kind::beta: out += "b" + std::to_string(pre_number); break;
    case pre_kind::rc: out += "rc" + std::to_string(pre_number); break;
  }
  return out;
}

std::string python_version::series() const {
  return std::to_string(major) + "." + std::to_string(minor);
}

bool operator<(python_version const &a, python_version const &b) {
  return to_semver(a) < to_semver(b);
}

bool operator==(python_version const &a, python_version const &b) {
  return to_semver(a) == to_semver(b);
}

specifier_set specifier_set::parse(std::string_view text) {
  specifier_set result;
  result.text_ = std::string{ util_trim(text) };
  if (result.text_.empty()) {
    throw invalid_specifier_error("Invalid version specifier '': empty");
  }

  std::string_view remaining{ result.text_ };
  while (true) {
    auto const comma{ remaining.find(',') };
    result.clauses_.push_back(parse_clause(remaining.substr(0, comma), result.text_));
    if (comma == std::string_view::npos) { break; }
    remaining.remove_prefix(comma + 1);
  }
  return result;
}

bool specifier_set::names_prerelease() const {
  return std::any_of(clauses_.begin(), clauses_.end(), [](clause const &c) {
    return c.version.is_prerelease() && c.oper != op::ne;
  });
}

bool specifier_set::contains(python_version const &v) const {
  if (v.is_prerelease() && !names_prerelease()) { return false; }
  return std::all_of(clauses_.begin(), clauses_.end(), [&](clause const &c) {
    return clause_matches(c, v);
  });
}

std::optional<python_version> select_highest(std::vector<python_version> const &candidates,
                                             specifier_set const &specs) {
  std::optional<python_version> best;
  for (auto const &v : candidates) {
    if (!specs.contains(v)) { continue; }
    if (!best || v > *best) { best = v; }
  }
  return best;
}

}  // namespace uvk
