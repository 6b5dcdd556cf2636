#include "mutation.h"

#include "errors.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <set>
#include <utility>

namespace uvk {

namespace {

std::int64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

// Normalised "name==version" lines, so freeze listings compare independent of order.
std::set<std::string> canonical_set(std::vector<std::string> const &lines) {
  std::set<std::string> result;
  for (auto const &line : lines) {
    auto const eq{ line.find("==") };
    if (eq == std::string::npos) {
      result.insert(std::string{ util_trim(line) });
    } else {
      result.insert(normalize_package_name(line.substr(0, eq)) + "==" +
                    std::string{ util_trim(std::string_view{ line }.substr(eq + 2)) });
    }
  }
  return result;
}

}  // namespace

std::string_view dependency_source_name(dependency_source source) {
  switch (source) {
    case dependency_source::inline_metadata: return "inline-metadata";
    case dependency_source::live_magic: return "live-magic";
  }
  return "unknown";
}

std::string_view mutation_strategy_name(mutation_strategy strategy) {
  switch (strategy) {
    case mutation_strategy::none: return "none";
    case mutation_strategy::live_patch: return "live-patch";
    case mutation_strategy::rebuild: return "rebuild";
  }
  return "unknown";
}

std::string normalize_package_name(std::string_view name) {
  std::string result;
  result.reserve(name.size());
  bool pending_sep{ false };
  for (char const c : name) {
    if (c == '-' || c == '_' || c == '.') {
      pending_sep = true;
      continue;
    }
    if (pending_sep && !result.empty()) { result.push_back('-'); }
    pending_sep = false;
    result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return result;
}

std::string requirement_name(std::string_view requirement) {
  auto const trimmed{ util_trim(requirement) };
  std::size_t end{ 0 };
  while (end < trimmed.size()) {
    char const c{ trimmed[end] };
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_' && c != '.') {
      break;
    }
    ++end;
  }
  return normalize_package_name(trimmed.substr(0, end));
}

std::vector<std::string> freeze_lines(std::string_view output) {
  std::vector<std::string> result;
  for (auto const line : util_split_lines(output)) {
    auto const trimmed{ util_trim(line) };
    if (trimmed.empty() || trimmed.front() == '#') { continue; }
    result.emplace_back(trimmed);
  }
  return result;
}

std::vector<std::string> merge_dependencies(std::vector<std::string> const &declared,
                                            std::vector<std::string> const &requested) {
  std::vector<std::string> result;
  std::vector<bool> used(requested.size(), false);

  for (auto const &dep : declared) {
    auto const name{ requirement_name(dep) };
    auto const it{ std::find_if(requested.begin(), requested.end(), [&](auto const &r) {
      return requirement_name(r) == name;
    }) };
    if (it == requested.end()) {
      result.push_back(dep);
    } else {
      auto const idx{ static_cast<std::size_t>(it - requested.begin()) };
      if (!used[idx]) { result.push_back(*it); }
      used[idx] = true;
    }
  }

  for (std::size_t i{ 0 }; i < requested.size(); ++i) {
    if (used[i]) { continue; }
    bool const duplicate{ std::find(result.begin(), result.end(), requested[i]) !=
                          result.end() };
    if (!duplicate) { result.push_back(requested[i]); }
  }
  return result;
}

std::vector<std::string> pending_dependencies(std::vector<std::string> const &declared,
                                              std::vector<std::string> const &requested) {
  std::vector<std::string> result;
  for (auto const &spec : requested) {
    auto const trimmed{ std::string{ util_trim(spec) } };
    if (trimmed.empty()) { continue; }
    if (std::find(declared.begin(), declared.end(), trimmed) != declared.end()) { continue; }
    if (std::find(result.begin(), result.end(), trimmed) != result.end()) { continue; }
    result.push_back(trimmed);
  }
  return result;
}

mutation_strategy mutation_choose_strategy(mutation_policy policy,
                                           std::vector<std::string> const &declared,
                                           std::vector<std::string> const &installed,
                                           std::vector<std::string> const &requested) {
  auto const pending{ pending_dependencies(declared, requested) };
  if (pending.empty()) { return mutation_strategy::none; }

  switch (policy) {
    case mutation_policy::live: return mutation_strategy::live_patch;
    case mutation_policy::rebuild: return mutation_strategy::rebuild;
    case mutation_policy::automatic: break;
  }

  std::set<std::string> present;
  for (auto const &dep : declared) { present.insert(requirement_name(dep)); }
  for (auto const &line : installed) { present.insert(requirement_name(line)); }

  for (auto const &spec : pending) {
    if (present.contains(requirement_name(spec))) { return mutation_strategy::rebuild; }
  }
  return mutation_strategy::live_patch;
}

mutation_outcome mutation_handler::apply(ephemeral_environment &env,
                                         dependency_request const &request,
                                         std::stop_token stop) {
  auto const pending{ pending_dependencies(env.dependencies, request.specifiers) };
  if (pending.empty()) {
    tui::info("Dependencies already satisfied; nothing to install");
    return { .strategy = mutation_strategy::none, .dependencies = env.dependencies };
  }

  build_options const opts{ .timeout = provisioner_.install_timeout(), .stop = stop };

  std::vector<std::string> snapshot;
  if (policy_ != mutation_policy::rebuild) {
    auto const frozen{ provisioner_.builder().freeze(env.root, opts) };
    if (!frozen.success) {
      throw mutation_error("Cannot list packages installed in " + env.root.string(),
                           frozen.output);
    }
    snapshot = freeze_lines(frozen.output);
  }

  auto const strategy{ mutation_choose_strategy(policy_,
                                                env.dependencies,
                                                snapshot,
                                                request.specifiers) };
  tui::debug("Applying %zu %s dependencies via %s",
             pending.size(),
             std::string{ dependency_source_name(request.source) }.c_str(),
             std::string{ mutation_strategy_name(strategy) }.c_str());
  UVK_TRACE_MUTATION_START(env.root.string(),
                           std::string{ mutation_strategy_name(strategy) },
                           util_join(pending, " "));

  if (strategy == mutation_strategy::rebuild) { return rebuild(env, pending, stop); }
  return live_patch(env, pending, snapshot, stop);
}

mutation_outcome mutation_handler::live_patch(ephemeral_environment &env,
                                              std::vector<std::string> const &pending,
                                              std::vector<std::string> const &snapshot,
                                              std::stop_token stop) {
  auto const start{ std::chrono::steady_clock::now() };
  auto &builder{ provisioner_.builder() };
  build_options const opts{ .timeout = provisioner_.install_timeout(), .stop = stop };

  auto const installed{ builder.install(env.root, pending, opts) };
  if (installed.success) {
    env.dependencies = merge_dependencies(env.dependencies, pending);
    UVK_TRACE_MUTATION_COMPLETE(env.root.string(), "live-patch", true, false, elapsed_ms(start));
    return { .strategy = mutation_strategy::live_patch, .dependencies = env.dependencies };
  }

  tui::warn("Installing %s failed; restoring previous packages", util_join(pending, " ").c_str());

  // Rollback ignores the caller's stop token: a cancelled install must still be undone.
  build_options const rollback_opts{ .timeout = provisioner_.install_timeout() };
  bool consistent{ false };
  if (auto const synced{ builder.sync(env.root, snapshot, rollback_opts) }; synced.success) {
    if (auto const check{ builder.freeze(env.root, rollback_opts) }; check.success) {
      consistent = canonical_set(freeze_lines(check.output)) == canonical_set(snapshot);
    }
  }

  UVK_TRACE_MUTATION_COMPLETE(env.root.string(), "live-patch", false, true, elapsed_ms(start));

  std::string message{ "Failed to install " + util_join(pending, " ") };
  if (installed.timed_out) { message += " (timed out)"; }
  if (installed.cancelled) { message += " (cancelled)"; }
  if (!consistent) {
    tui::error("Environment %s could not be restored to its previous package set",
               env.root.string().c_str());
  }
  throw mutation_error(message, installed.output, true, consistent);
}

mutation_outcome mutation_handler::rebuild(ephemeral_environment const &env,
                                           std::vector<std::string> const &pending,
                                           std::stop_token stop) {
  auto const start{ std::chrono::steady_clock::now() };
  auto const merged{ merge_dependencies(env.dependencies, pending) };

  try {
    auto fresh{ provisioner_.create(env.interpreter, merged, stop) };
    UVK_TRACE_MUTATION_COMPLETE(env.root.string(), "rebuild", true, false, elapsed_ms(start));
    return { .strategy = mutation_strategy::rebuild,
             .dependencies = merged,
             .replacement = environment_lease{ provisioner_, std::move(fresh) } };
  } catch (provision_error const &e) {
    UVK_TRACE_MUTATION_COMPLETE(env.root.string(), "rebuild", false, false, elapsed_ms(start));
    throw mutation_error(std::string{ "Rebuild failed: " } + e.what(), e.cause());
  }
}

}  // namespace uvk
