#include "cmd_uninstall.h"

#include "kernelspec.h"
#include "platform.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>

namespace uvk {

void cmd_uninstall::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("uninstall", "Remove an installed uvk kernelspec") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("name", cfg_ptr->name, "Name of the kernelspec")->required();
  auto const dirs{ data_dir_register(*sub) };
  sub->callback([sub, dirs, cfg_ptr, on_selected = std::move(on_selected)] {
    cfg_ptr->data_dir = data_dir_selected(*sub, dirs);
    on_selected(*cfg_ptr);
  });
}

cmd_uninstall::cmd_uninstall(cfg cfg, std::optional<std::filesystem::path> const &)
    : cfg_{ std::move(cfg) } {}

int cmd_uninstall::execute() {
  kernelspec_registry registry{ kernelspec_kernels_dir(data_dir_resolve(cfg_.data_dir)),
                                platform::get_exe_path() };
  if (!registry.uninstall(cfg_.name)) {
    tui::error("No kernelspec named %s in %s",
               cfg_.name.c_str(),
               registry.kernels_dir().string().c_str());
    return 1;
  }
  tui::info("Removed kernelspec %s", cfg_.name.c_str());
  return 0;
}

}  // namespace uvk
