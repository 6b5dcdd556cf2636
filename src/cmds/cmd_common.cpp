#include "cmd_common.h"

#include "errors.h"
#include "platform.h"

#include "CLI11.hpp"

#include <string>

namespace uvk {

data_dir_options data_dir_register(CLI::App &sub) {
  std::string const sys_prefix_help{
    "Use the Jupyter data directory of uvk's own installation (equivalent to --prefix=" +
    sys_prefix().string() + ")"
  };
  return {
    .user = sub.add_flag("--user", "Use the per-user Jupyter data directory"),
    .prefix = sub.add_option("--prefix",
                             "Use the Jupyter data directory of the environment at PREFIX")
                  ->multi_option_policy(CLI::MultiOptionPolicy::TakeAll),
    .sys_prefix = sub.add_flag("--sys-prefix", sys_prefix_help),
  };
}

data_dir_selection data_dir_selected(CLI::App const &sub, data_dir_options const &opts) {
  data_dir_selection sel{ .user = opts.user->count() > 0 };

  std::size_t prefix_seen{ 0 };
  for (auto const *opt : sub.parse_order()) {
    if (opt == opts.prefix) {
      sel.prefix = std::filesystem::path{ opts.prefix->results().at(prefix_seen++) };
    } else if (opt == opts.sys_prefix) {
      sel.prefix = sys_prefix();
    }
  }
  return sel;
}

std::filesystem::path data_dir_resolve(data_dir_selection const &sel) {
  if (sel.user && sel.prefix) {
    throw uvk_error("Can't specify both --user and a prefix. Please choose one or the other.");
  }
  if (sel.prefix) { return platform::get_prefix_data_dir(*sel.prefix); }
  if (sel.user) {
    auto dir{ platform::get_user_data_dir() };
    if (!dir) { throw uvk_error("Cannot determine the per-user Jupyter data directory"); }
    return *dir;
  }
  return platform::get_system_data_dir();
}

std::filesystem::path sys_prefix() {
  return platform::get_exe_path().parent_path().parent_path();
}

}  // namespace uvk
