#pragma once

#include <filesystem>
#include <optional>

namespace CLI {
class App;
class Option;
}  // namespace CLI

namespace uvk {

// Which Jupyter data directory a registry command works on.
struct data_dir_selection {
  bool user{ false };
  std::optional<std::filesystem::path> prefix;  // --prefix or --sys-prefix, last one given
};

// --user, --prefix PATH and --sys-prefix on `sub`. Call data_dir_selected from the
// subcommand callback to read them back.
struct data_dir_options {
  CLI::Option *user;
  CLI::Option *prefix;
  CLI::Option *sys_prefix;
};

data_dir_options data_dir_register(CLI::App &sub);
data_dir_selection data_dir_selected(CLI::App const &sub, data_dir_options const &opts);

// Throws uvk_error when both --user and a prefix are given.
std::filesystem::path data_dir_resolve(data_dir_selection const &sel);

// Prefix of the running uvk installation (<prefix>/bin/uvk).
std::filesystem::path sys_prefix();

}  // namespace uvk
