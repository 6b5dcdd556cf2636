#include "uv.h"

#include "platform.h"
#include "util.h"

#include "doctest.h"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using strings = std::vector<std::string>;

TEST_CASE("uv_argv builds uv command lines") {
  fs::path const uv{ "/usr/bin/uv" };
  fs::path const root{ "/tmp/uvk/env" };

  CHECK(uvk::uv_argv::venv(uv, "/py/bin/python3.12", root) ==
        strings{ "/usr/bin/uv", "venv", "--quiet", "--python", "/py/bin/python3.12",
                 "/tmp/uvk/env" });

  CHECK(uvk::uv_argv::pip_install(uv, root, { "numpy", "scipy>=1.12" }) ==
        strings{ "/usr/bin/uv", "pip", "install", "--python", "/tmp/uvk/env/bin/python",
                 "numpy", "scipy>=1.12" });

  CHECK(uvk::uv_argv::pip_freeze(uv, root) ==
        strings{ "/usr/bin/uv", "pip", "freeze", "--python", "/tmp/uvk/env/bin/python" });

  CHECK(uvk::uv_argv::pip_sync(uv, root, "/tmp/req.txt") ==
        strings{ "/usr/bin/uv", "pip", "sync", "--python", "/tmp/uvk/env/bin/python",
                 "/tmp/req.txt" });

  CHECK(uvk::uv_argv::python_list(uv) ==
        strings{ "/usr/bin/uv", "python", "list", "--only-installed", "--output-format",
                 "json" });

  CHECK(uvk::uv_argv::python_install(uv, ">=3.10,<3.12") ==
        strings{ "/usr/bin/uv", "python", "install", ">=3.10,<3.12" });
}

TEST_CASE("uv_parse_python_list keeps installed cpython entries") {
  auto const interpreters{ uvk::uv_parse_python_list(R"json([
    {"key": "cpython-3.12.4-linux-x86_64-gnu", "version": "3.12.4",
     "path": "/home/u/.local/share/uv/python/cpython-3.12.4/bin/python3.12",
     "implementation": "cpython"},
    {"key": "pypy-3.10.14-linux-x86_64-gnu", "version": "3.10.14",
     "path": "/opt/pypy/bin/pypy3", "implementation": "pypy"},
    {"key": "cpython-3.13.0-linux-x86_64-gnu", "version": "3.13.0", "path": null,
     "implementation": "cpython"},
    {"key": "cpython-3.14.0a3-linux-x86_64-gnu", "version": "3.14.0a3",
     "path": "/usr/local/bin/python3.14", "implementation": "cpython"},
    {"version": "not-a-version", "path": "/usr/bin/python3"}
  ])json") };

  REQUIRE(interpreters.size() == 2);
  CHECK(interpreters[0].version.str() == "3.12.4");
  CHECK(interpreters[0].path.filename() == "python3.12");
  CHECK(interpreters[1].version.is_prerelease());
}

TEST_CASE("uv_parse_python_list tolerates garbage") {
  CHECK(uvk::uv_parse_python_list("").empty());
  CHECK(uvk::uv_parse_python_list("{\"not\": \"an array\"}").empty());
  CHECK(uvk::uv_parse_python_list("[1, 2, 3]").empty());
}

TEST_CASE("uv_parse_python_version_output") {
  CHECK(uvk::uv_parse_python_version_output("Python 3.11.2\n")->str() == "3.11.2");
  CHECK(uvk::uv_parse_python_version_output("warning: x\nPython 3.13.0rc2")->str() ==
        "3.13.0rc2");
  CHECK_FALSE(uvk::uv_parse_python_version_output("bash: python: not found").has_value());
}

TEST_CASE("uv_interpreter_source::query_version runs the interpreter") {
  auto const dir{ uvk::platform::make_unique_dir(fs::temp_directory_path(), "uvk-uv-test-") };
  uvk::scoped_path_cleanup cleanup{ dir };

  auto const python{ dir / "python3" };
  uvk::util_write_file(python, "#!/bin/sh\necho 'Python 3.10.4'\n");
  fs::permissions(python, fs::perms::owner_all);

  uvk::uv_interpreter_source source{ "/nonexistent/uv", std::chrono::milliseconds{ 5000 } };
  auto const version{ source.query_version(python) };
  REQUIRE(version.has_value());
  CHECK(version->str() == "3.10.4");

  CHECK_FALSE(source.query_version(dir / "missing").has_value());
  CHECK(source.list_installed().empty());
}
