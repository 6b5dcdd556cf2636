#include "kernelspec.h"

#include "errors.h"
#include "platform.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <memory>
#include <optional>
#include <system_error>

namespace uvk {

namespace {

constexpr char kLockName[]{ ".uvk-registry.lock" };
constexpr char kKernelProtocolVersion[]{ "5.5" };

constexpr std::string_view kLogoSvg{
  R"(<svg xmlns="http://www.w3.org/2000/svg" width="64" height="64" viewBox="0 0 64 64">
  <rect x="2" y="2" width="60" height="60" rx="12" fill="#2b2d42"/>
  <path d="M16 18v18a10 10 0 0 0 20 0V18" fill="none" stroke="#edf2f4" stroke-width="5"/>
  <path d="M38 18l6 28 6-28" fill="none" stroke="#ef233c" stroke-width="5"/>
</svg>
)"
};

std::string format_created(std::chrono::system_clock::time_point tp) {
  std::time_t const t{ std::chrono::system_clock::to_time_t(tp) };
  std::tm utc{};
  gmtime_r(&t, &utc);
  char buf[32]{};
  if (std::strftime(buf, sizeof buf, "%Y-%m-%dT%H:%M:%SZ", &utc) == 0) { return {}; }
  return buf;
}

std::chrono::system_clock::time_point parse_created(std::string const &text) {
  std::tm utc{};
  if (!::strptime(text.c_str(), "%Y-%m-%dT%H:%M:%SZ", &utc)) { return {}; }
  return std::chrono::system_clock::from_time_t(::timegm(&utc));
}

void copy_icon(std::filesystem::path const &icon, std::filesystem::path const &dir) {
  auto ext{ icon.extension().string() };
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  auto const dest{ dir /
                   (ext == ".svg" ? std::string{ "logo-svg.svg" } : "logo-64x64" + ext) };

  std::error_code ec;
  std::filesystem::copy_file(icon, dest, std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    throw registry_error("Cannot copy icon " + icon.string() + ": " + ec.message());
  }
}

std::optional<std::filesystem::path> installed_icon(std::filesystem::path const &dir) {
  std::error_code ec;
  for (auto const &entry : std::filesystem::directory_iterator{ dir, ec }) {
    auto const name{ entry.path().filename().string() };
    if (name.starts_with("logo-64x64")) { return entry.path(); }
  }
  if (platform::file_exists(dir / "logo-svg.svg")) { return dir / "logo-svg.svg"; }
  return std::nullopt;
}

void restore_replaced(std::filesystem::path const &aside, std::filesystem::path const &dest) {
  try {
    platform::atomic_rename(aside, dest);
  } catch (std::system_error const &e) {
    tui::error("Previous kernel left at %s: %s", aside.c_str(), e.what());
  }
}

}  // namespace

bool kernel_spec_name_valid(std::string_view name) {
  if (name.empty()) { return false; }
  return std::all_of(name.begin(), name.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-';
  });
}

std::string kernel_spec_default_display_name(std::optional<interpreter_selector> const &python) {
  if (python) {
    if (auto const *c{ std::get_if<version_constraint>(&*python) }) {
      if (auto const v{ python_version::parse(c->expression) }) {
        return "UVK (Python " + v->series() + ")";
      }
    }
  }
  return "UVK";
}

std::vector<std::string> kernel_spec_argv(std::filesystem::path const &launcher,
                                          kernel_spec const &spec) {
  std::vector<std::string> argv{ launcher.string(), "launch", "--kernel-name", spec.name };
  if (spec.python) {
    argv.push_back("--python");
    argv.push_back(interpreter_selector_describe(*spec.python));
  }
  argv.push_back("-f");
  argv.push_back("{connection_file}");
  return argv;
}

std::string kernel_spec_to_json(kernel_spec const &spec, std::filesystem::path const &launcher) {
  nlohmann::ordered_json env = nlohmann::ordered_json::object();
  for (auto const &[key, value] : spec.env) { env[key] = value; }

  nlohmann::ordered_json python = nullptr;
  if (spec.python) {
    python = { { "kind", std::string{ interpreter_selector_kind(*spec.python) } },
               { "value", interpreter_selector_describe(*spec.python) } };
  }

  nlohmann::ordered_json doc;
  doc["argv"] = kernel_spec_argv(launcher, spec);
  doc["display_name"] = spec.display_name;
  doc["language"] = spec.language;
  doc["env"] = std::move(env);
  doc["interrupt_mode"] = "signal";
  doc["metadata"] = {
    { "debugger", true },
    { "uvk", { { "python", python }, { "created", format_created(spec.created) } } },
  };
  doc["kernel_protocol_version"] = kKernelProtocolVersion;
  return doc.dump(2) + "\n";
}

std::optional<kernel_spec> kernel_spec_from_json(std::string_view json, std::string name) {
  auto const doc = nlohmann::json::parse(json, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) { return std::nullopt; }

  try {
    kernel_spec spec;
    spec.name = name;
    spec.display_name = doc.value("display_name", spec.name);
    spec.language = doc.value("language", std::string{});
    spec.argv = doc.at("argv").get<std::vector<std::string>>();

    if (auto const it{ doc.find("env") }; it != doc.end() && it->is_object()) {
      for (auto const &[key, value] : it->items()) {
        spec.env.emplace_back(key, value.get<std::string>());
      }
    }

    auto const meta = doc.value("metadata", nlohmann::json::object());
    if (auto const uvk_meta{ meta.find("uvk") };
        uvk_meta != meta.end() && uvk_meta->is_object()) {
      if (auto const py{ uvk_meta->find("python") }; py != uvk_meta->end() && py->is_object()) {
        auto const kind{ py->value("kind", std::string{}) };
        auto const value{ py->value("value", std::string{}) };
        if (kind == "path") {
          spec.python = explicit_path{ value };
        } else if (kind == "constraint") {
          spec.python = version_constraint{ value };
        }
      }
      spec.created = parse_created(uvk_meta->value("created", std::string{}));
    }
    return spec;
  } catch (nlohmann::json::exception const &e) {
    tui::debug("kernel.json for %s is malformed: %s", name.c_str(), e.what());
    return std::nullopt;
  }
}

std::filesystem::path kernelspec_kernels_dir(std::filesystem::path const &data_dir) {
  return data_dir / "kernels";
}

kernelspec_registry::kernelspec_registry(std::filesystem::path kernels_dir,
                                         std::filesystem::path launcher)
    : kernels_dir_{ std::move(kernels_dir) }, launcher_{ std::move(launcher) } {}

void kernelspec_registry::install(kernel_spec const &spec) {
  if (!kernel_spec_name_valid(spec.name)) {
    throw registry_error("Invalid kernel name '" + spec.name +
                         "': use letters, digits, '.', '_' and '-' only");
  }

  std::error_code ec;
  std::filesystem::create_directories(kernels_dir_, ec);
  if (ec) {
    throw registry_error("Cannot create kernel directory " + kernels_dir_.string() + ": " +
                         ec.message());
  }

  try {
    platform::file_lock const lock{ kernels_dir_ / kLockName };

    auto const staging{ platform::make_unique_dir(kernels_dir_, ".uvk-staging-") };
    scoped_path_cleanup staging_cleanup{ staging };

    kernel_spec stamped{ spec };
    if (stamped.created == std::chrono::system_clock::time_point{}) {
      stamped.created = std::chrono::system_clock::now();
    }

    util_write_file(staging / "kernel.json", kernel_spec_to_json(stamped, launcher_));
    util_write_file(staging / "logo-svg.svg", kLogoSvg);
    if (spec.icon) { copy_icon(*spec.icon, staging); }
    std::filesystem::permissions(staging,
                                 std::filesystem::perms::owner_all |
                                     std::filesystem::perms::group_read |
                                     std::filesystem::perms::group_exec |
                                     std::filesystem::perms::others_read |
                                     std::filesystem::perms::others_exec);

    auto const dest{ kernels_dir_ / spec.name };
    std::optional<std::filesystem::path> aside;
    if (platform::file_exists(dest)) {
      aside = kernels_dir_ / (".uvk-replaced-" + spec.name + "-" + util_random_hex(4));
      platform::atomic_rename(dest, *aside);
    }

    if (publish_observer_) { publish_observer_(staging); }
    try {
      platform::atomic_rename(staging, dest);
    } catch (std::system_error const &) {
      if (aside) { restore_replaced(*aside, dest); }
      throw;
    }
    staging_cleanup.release();

    if (aside) {
      if (auto const err{ platform::remove_all_with_retry(*aside) }) {
        tui::warn("Cannot remove replaced kernel %s: %s", aside->c_str(), err.message().c_str());
      }
    }
  } catch (registry_error const &) {
    throw;
  } catch (std::system_error const &e) {
    throw registry_error("Failed to install kernel '" + spec.name + "' in " +
                         kernels_dir_.string() + ": " + e.what());
  }

  tui::info("Installed kernel '%s' in %s", spec.name.c_str(), (kernels_dir_ / spec.name).c_str());
  UVK_TRACE_REGISTRY_OP("install", spec.name, kernels_dir_.string());
}

bool kernelspec_registry::uninstall(std::string const &name) {
  if (!kernel_spec_name_valid(name)) { return false; }
  auto const dest{ kernels_dir_ / name };
  if (!platform::file_exists(dest)) {
    tui::debug("Kernel '%s' is not installed in %s", name.c_str(), kernels_dir_.c_str());
    return false;
  }

  try {
    platform::file_lock const lock{ kernels_dir_ / kLockName };
    if (!platform::file_exists(dest)) { return false; }

    auto const doomed{ kernels_dir_ / (".uvk-removed-" + name + "-" + util_random_hex(4)) };
    platform::atomic_rename(dest, doomed);
    if (auto const ec{ platform::remove_all_with_retry(doomed) }) {
      tui::warn("Kernel '%s' uninstalled but %s could not be removed: %s",
                name.c_str(),
                doomed.c_str(),
                ec.message().c_str());
    }
  } catch (std::system_error const &e) {
    throw registry_error("Failed to uninstall kernel '" + name + "' from " +
                         kernels_dir_.string() + ": " + e.what());
  }

  tui::info("Removed kernel '%s' from %s", name.c_str(), kernels_dir_.c_str());
  UVK_TRACE_REGISTRY_OP("uninstall", name, kernels_dir_.string());
  return true;
}

std::vector<kernel_spec> kernelspec_registry::list() const {
  std::vector<kernel_spec> result;

  std::error_code ec;
  for (auto const &entry : std::filesystem::directory_iterator{ kernels_dir_, ec }) {
    auto const name{ entry.path().filename().string() };
    if (name.starts_with(".") || !entry.is_directory(ec)) { continue; }

    auto const json_path{ entry.path() / "kernel.json" };
    if (!platform::file_exists(json_path)) { continue; }

    std::string text;
    try {
      text = util_load_text(json_path);
    } catch (std::runtime_error const &e) {
      tui::warn("Skipping kernel '%s': %s", name.c_str(), e.what());
      continue;
    }

    auto spec{ kernel_spec_from_json(text, name) };
    if (!spec) {
      tui::warn("Skipping kernel '%s': malformed kernel.json", name.c_str());
      continue;
    }
    spec->resource_dir = entry.path();
    spec->icon = installed_icon(entry.path());
    result.push_back(std::move(*spec));
  }

  std::sort(result.begin(), result.end(), [](auto const &a, auto const &b) {
    return a.name < b.name;
  });
  return result;
}

std::optional<kernel_spec> kernelspec_registry::find(std::string const &name) const {
  if (!kernel_spec_name_valid(name)) { return std::nullopt; }
  auto const dir{ kernels_dir_ / name };
  auto const json_path{ dir / "kernel.json" };
  if (!platform::file_exists(json_path)) { return std::nullopt; }

  std::optional<kernel_spec> spec;
  try {
    spec = kernel_spec_from_json(util_load_text(json_path), name);
  } catch (std::runtime_error const &e) {
    tui::warn("Cannot read kernel '%s': %s", name.c_str(), e.what());
    return std::nullopt;
  }
  if (spec) {
    spec->resource_dir = dir;
    spec->icon = installed_icon(dir);
  }
  return spec;
}

}  // namespace uvk
