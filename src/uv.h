#pragma once

#include "env_builder.h"
#include "interpreter.h"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace uvk {

// Command lines handed to uv. Kept separate from execution so they can be inspected.
namespace uv_argv {

std::vector<std::string> venv(std::filesystem::path const &uv,
                              std::filesystem::path const &interpreter,
                              std::filesystem::path const &root);
std::vector<std::string> pip_install(std::filesystem::path const &uv,
                                     std::filesystem::path const &root,
                                     std::vector<std::string> const &dependencies);
std::vector<std::string> pip_freeze(std::filesystem::path const &uv,
                                    std::filesystem::path const &root);
std::vector<std::string> pip_sync(std::filesystem::path const &uv,
                                  std::filesystem::path const &root,
                                  std::filesystem::path const &requirements_file);
std::vector<std::string> python_list(std::filesystem::path const &uv);
std::vector<std::string> python_install(std::filesystem::path const &uv,
                                        std::string const &request);

}  // namespace uv_argv

// `uv python list --output-format json` payload -> usable interpreters.
std::vector<installed_interpreter> uv_parse_python_list(std::string_view json);

// "Python 3.11.2" -> 3.11.2
std::optional<python_version> uv_parse_python_version_output(std::string_view text);

class uv_env_builder : public env_builder {
 public:
  explicit uv_env_builder(std::filesystem::path uv) : uv_{ std::move(uv) } {}

  build_result build(std::filesystem::path const &interpreter,
                     std::filesystem::path const &root,
                     std::vector<std::string> const &dependencies,
                     build_options const &opts) override;
  build_result install(std::filesystem::path const &root,
                       std::vector<std::string> const &dependencies,
                       build_options const &opts) override;
  build_result freeze(std::filesystem::path const &root, build_options const &opts) override;
  build_result sync(std::filesystem::path const &root,
                    std::vector<std::string> const &requirements,
                    build_options const &opts) override;

 private:
  std::filesystem::path uv_;
};

class uv_interpreter_source : public interpreter_source {
 public:
  uv_interpreter_source(std::filesystem::path uv, std::chrono::milliseconds install_timeout)
      : uv_{ std::move(uv) }, install_timeout_{ install_timeout } {}

  std::vector<installed_interpreter> list_installed() override;
  build_result install(specifier_set const &constraint) override;
  std::optional<python_version> query_version(std::filesystem::path const &path) override;

 private:
  std::filesystem::path uv_;
  std::chrono::milliseconds install_timeout_;
};

}  // namespace uvk
