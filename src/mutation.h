#pragma once

#include "config.h"
#include "provisioner.h"

#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace uvk {

enum class dependency_source { inline_metadata, live_magic };

std::string_view dependency_source_name(dependency_source source);

struct dependency_request {
  std::vector<std::string> specifiers;
  dependency_source source{ dependency_source::live_magic };
};

enum class mutation_strategy { none, live_patch, rebuild };

std::string_view mutation_strategy_name(mutation_strategy strategy);

// PEP 503 normalisation: lowercase, runs of '-', '_' and '.' become one '-'.
std::string normalize_package_name(std::string_view name);

// Normalised distribution name of a requirement: "Foo_Bar[x]>=1.0; python_version>'3'"
// -> "foo-bar".
std::string requirement_name(std::string_view requirement);

// Requirement lines of a freeze listing (blank lines and comments dropped).
std::vector<std::string> freeze_lines(std::string_view output);

// `declared` with every entry naming the same package as a requested one replaced, and
// the remaining requested entries appended.
std::vector<std::string> merge_dependencies(std::vector<std::string> const &declared,
                                            std::vector<std::string> const &requested);

// The specifiers of `requested` not already present verbatim in `declared`.
std::vector<std::string> pending_dependencies(std::vector<std::string> const &declared,
                                              std::vector<std::string> const &requested);

// auto: rebuild when a pending requirement names a package that is declared or installed,
// live patch when every pending requirement is new, none when nothing is pending.
mutation_strategy mutation_choose_strategy(mutation_policy policy,
                                           std::vector<std::string> const &declared,
                                           std::vector<std::string> const &installed,
                                           std::vector<std::string> const &requested);

struct mutation_outcome {
  mutation_strategy strategy{ mutation_strategy::none };
  std::vector<std::string> dependencies;  // declared set after the mutation
  environment_lease replacement;          // rebuild only; the caller swaps it in
};

class mutation_handler {
 public:
  mutation_handler(provisioner &prov, mutation_policy policy)
      : provisioner_{ prov }, policy_{ policy } {}

  // Throws mutation_error; `env` is untouched unless a live patch succeeds, in which case
  // its dependency set is updated in place. A rebuild leaves `env` as it was and returns
  // the new environment in `replacement`.
  mutation_outcome apply(ephemeral_environment &env,
                         dependency_request const &request,
                         std::stop_token stop = {});

  mutation_policy policy() const { return policy_; }

 private:
  mutation_outcome live_patch(ephemeral_environment &env,
                              std::vector<std::string> const &pending,
                              std::vector<std::string> const &snapshot,
                              std::stop_token stop);
  mutation_outcome rebuild(ephemeral_environment const &env,
                           std::vector<std::string> const &pending,
                           std::stop_token stop);

  provisioner &provisioner_;
  mutation_policy policy_;
};

}  // namespace uvk
