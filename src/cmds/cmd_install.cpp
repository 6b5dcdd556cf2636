#include "cmd_install.h"

#include "errors.h"
#include "kernelspec.h"
#include "platform.h"

#include "CLI11.hpp"

#include <chrono>
#include <memory>

namespace uvk {

void cmd_install::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("install",
                                "Deploy the uvk kernelspec. By default it goes to the system "
                                "Jupyter data directory; --user and --prefix change that.") };
  auto cfg_ptr{ std::make_shared<cfg>() };

  sub->add_option("--name", cfg_ptr->name, "Name of the kernelspec")->capture_default_str();
  sub->add_option("--display-name",
                  cfg_ptr->display_name,
                  "Name shown in the Jupyter interface (default: UVK (Python X.Y))");
  auto const dirs{ data_dir_register(*sub) };
  auto *env_opt{ sub->add_option("--env",
                                 "Define VARIABLE as VALUE in the kernel's environment")
                     ->type_size(2)
                     ->type_name("VARIABLE VALUE")
                     ->multi_option_policy(CLI::MultiOptionPolicy::TakeAll) };
  auto *tmp_opt{ sub->add_option("--tmp",
                                 "Directory where the kernel's environments are instantiated")
                     ->multi_option_policy(CLI::MultiOptionPolicy::TakeAll) };
  sub->add_option("-p,--python",
                  cfg_ptr->python,
                  "Interpreter: a version (3.12, 3.13.3), a constraint (>=3.10,<3.12) or "
                  "the path of a Python executable");
  sub->add_option("--icon", cfg_ptr->icon, "Logo replacing the built-in one")
      ->check(CLI::ExistingFile);

  sub->callback([sub, dirs, env_opt, tmp_opt, cfg_ptr, on_selected = std::move(on_selected)] {
    cfg_ptr->data_dir = data_dir_selected(*sub, dirs);

    // --env and --tmp both append to the same list; keep command-line order.
    std::size_t env_seen{ 0 };
    std::size_t tmp_seen{ 0 };
    for (auto const *opt : sub->parse_order()) {
      if (opt == env_opt) {
        auto const &raw{ env_opt->results() };
        cfg_ptr->env.emplace_back(raw.at(env_seen), raw.at(env_seen + 1));
        env_seen += 2;
      } else if (opt == tmp_opt) {
        cfg_ptr->env.emplace_back("TMPDIR", tmp_opt->results().at(tmp_seen++));
      }
    }
    on_selected(*cfg_ptr);
  });
}

cmd_install::cmd_install(cfg cfg, std::optional<std::filesystem::path> const &)
    : cfg_{ std::move(cfg) } {}

int cmd_install::execute() {
  std::optional<interpreter_selector> python;
  if (cfg_.python) { python = interpreter_selector_parse(*cfg_.python); }

  kernel_spec spec{ .name = cfg_.name,
                    .display_name = cfg_.display_name.value_or(
                        kernel_spec_default_display_name(python)),
                    .python = python,
                    .env = cfg_.env,
                    .icon = cfg_.icon,
                    .created = std::chrono::system_clock::now() };

  auto const data_dir{ data_dir_resolve(cfg_.data_dir) };
  kernelspec_registry registry{ kernelspec_kernels_dir(data_dir),
                                cfg_.launcher.value_or(platform::get_exe_path()) };
  registry.install(spec);
  return 0;
}

}  // namespace uvk
