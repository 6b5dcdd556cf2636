#include "cmd_list.h"

#include "platform.h"
#include "tui.h"

#include "CLI11.hpp"

#include <algorithm>
#include <memory>
#include <set>
#include <string>

namespace uvk {

void cmd_list::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("list", "List installed kernelspecs") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  auto const dirs{ data_dir_register(*sub) };
  sub->callback([sub, dirs, cfg_ptr, on_selected = std::move(on_selected)] {
    cfg_ptr->data_dir = data_dir_selected(*sub, dirs);
    on_selected(*cfg_ptr);
  });
}

cmd_list::cmd_list(cfg cfg, std::optional<std::filesystem::path> const &)
    : cfg_{ std::move(cfg) } {}

std::vector<std::filesystem::path> cmd_list_search_dirs(data_dir_selection const &sel) {
  std::vector<std::filesystem::path> dirs;
  for (auto const &entry : platform::get_jupyter_path_entries()) {
    dirs.push_back(kernelspec_kernels_dir(entry));
  }
  dirs.push_back(kernelspec_kernels_dir(data_dir_resolve(sel)));
  return dirs;
}

std::vector<kernel_spec> cmd_list_collect(std::vector<std::filesystem::path> const &kernels_dirs) {
  auto const launcher{ platform::get_exe_path() };

  std::vector<kernel_spec> result;
  std::set<std::string> seen;
  for (auto const &dir : kernels_dirs) {
    for (auto &spec : kernelspec_registry{ dir, launcher }.list()) {
      if (seen.insert(spec.name).second) { result.push_back(std::move(spec)); }
    }
  }
  std::sort(result.begin(), result.end(), [](auto const &a, auto const &b) {
    return a.name < b.name;
  });
  return result;
}

int cmd_list::execute() {
  auto const specs{ cmd_list_collect(cmd_list_search_dirs(cfg_.data_dir)) };
  if (specs.empty()) {
    tui::info("No kernelspecs installed");
    return 0;
  }

  std::size_t width{ 0 };
  for (auto const &spec : specs) { width = std::max(width, spec.name.size()); }
  for (auto const &spec : specs) {
    tui::print_stdout("%-*s  %s\n",
                      static_cast<int>(width),
                      spec.name.c_str(),
                      spec.resource_dir.string().c_str());
  }
  return 0;
}

}  // namespace uvk
