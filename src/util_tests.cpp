#include "util.h"

#include "doctest.h"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <variant>
#include <vector>

namespace {

std::filesystem::path make_temp_path(char const *tag) {
  static std::atomic<int> counter{ 0 };
  auto const id = counter.fetch_add(1, std::memory_order_relaxed);
  auto base{ std::filesystem::temp_directory_path() };
  return base / ("uvk-util-test-" + std::string(tag) + "-" + std::to_string(id));
}

void write_dummy_file(std::filesystem::path const &path) {
  std::ofstream out{ path };
  out << "uvk-test";
}

}  // namespace

TEST_CASE("match with std::variant of int and string") {
  using var_t = std::variant<int, std::string>;

  var_t v1{ 42 };
  var_t v2{ std::string("hello") };

  auto visitor{ uvk::match{
      [](int x) { return x * 2; },
      [](std::string const &s) { return static_cast<int>(s.size()); } } };

  CHECK(std::visit(visitor, v1) == 84);
  CHECK(std::visit(visitor, v2) == 5);
}

TEST_CASE("util_random_hex yields distinct names of the requested width") {
  auto const a{ uvk::util_random_hex(8) };
  auto const b{ uvk::util_random_hex(8) };
  CHECK(a.size() == 16);
  CHECK(b.size() == 16);
  CHECK(a != b);
}

TEST_CASE("util_trim strips surrounding whitespace only") {
  CHECK(uvk::util_trim("  numpy  ") == "numpy");
  CHECK(uvk::util_trim("\t\na b\r\n") == "a b");
  CHECK(uvk::util_trim("   ").empty());
  CHECK(uvk::util_trim("").empty());
}

TEST_CASE("util_split_whitespace") {
  SUBCASE("empty input") { CHECK(uvk::util_split_whitespace("").empty()); }

  SUBCASE("single token") {
    CHECK(uvk::util_split_whitespace("numpy") == std::vector<std::string>{ "numpy" });
  }

  SUBCASE("mixed separators and indentation") {
    auto const tokens{ uvk::util_split_whitespace(
        "\n  numpy scipy>=1.12\n      scikit-learn==1.8.0\n\tpandas   pyarrow\n") };
    CHECK(tokens == std::vector<std::string>{
                        "numpy", "scipy>=1.12", "scikit-learn==1.8.0", "pandas", "pyarrow" });
  }

  SUBCASE("specifier commas stay within a token") {
    auto const tokens{ uvk::util_split_whitespace("scipy>=1.12,<1.15,!=1.13.1") };
    REQUIRE(tokens.size() == 1);
    CHECK(tokens[0] == "scipy>=1.12,<1.15,!=1.13.1");
  }
}

TEST_CASE("util_split_lines keeps empty lines and strips carriage returns") {
  auto const lines{ uvk::util_split_lines("a\r\n\nb") };
  REQUIRE(lines.size() == 3);
  CHECK(lines[0] == "a");
  CHECK(lines[1].empty());
  CHECK(lines[2] == "b");
}

TEST_CASE("util_join") {
  CHECK(uvk::util_join({}, ", ").empty());
  CHECK(uvk::util_join({ "a" }, ", ") == "a");
  CHECK(uvk::util_join({ "a", "b", "c" }, ", ") == "a, b, c");
}

TEST_CASE("util_write_file and util_load_text") {
  auto const path{ make_temp_path("text") };
  uvk::scoped_path_cleanup cleanup{ path };

  uvk::util_write_file(path, "line one\nline two\n");
  CHECK(uvk::util_load_text(path) == "line one\nline two\n");

  uvk::util_write_file(path, "");
  CHECK(uvk::util_load_text(path).empty());
}

TEST_CASE("util_load_text throws on nonexistent file") {
  CHECK_THROWS_AS(uvk::util_load_text("/nonexistent/uvk/file.txt"), std::runtime_error);
}

TEST_CASE("scoped_path_cleanup removes file on destruction") {
  auto const path{ make_temp_path("file") };
  write_dummy_file(path);
  REQUIRE(std::filesystem::exists(path));
  { uvk::scoped_path_cleanup cleanup{ path }; }
  CHECK_FALSE(std::filesystem::exists(path));
}

TEST_CASE("scoped_path_cleanup removes directory trees") {
  auto const dir{ make_temp_path("dir") };
  std::filesystem::create_directories(dir / "nested" / "deeper");
  write_dummy_file(dir / "nested" / "deeper" / "file.txt");
  { uvk::scoped_path_cleanup cleanup{ dir }; }
  CHECK_FALSE(std::filesystem::exists(dir));
}

TEST_CASE("scoped_path_cleanup reset switches targets and cleans previous path") {
  auto const first{ make_temp_path("first") };
  auto const second{ make_temp_path("second") };
  write_dummy_file(first);
  write_dummy_file(second);
  {
    uvk::scoped_path_cleanup cleanup{ first };
    cleanup.reset(second);
    CHECK_FALSE(std::filesystem::exists(first));
    CHECK(std::filesystem::exists(second));
  }
  CHECK_FALSE(std::filesystem::exists(second));
}

TEST_CASE("scoped_path_cleanup release disarms") {
  auto const path{ make_temp_path("disarm") };
  write_dummy_file(path);
  {
    uvk::scoped_path_cleanup cleanup{ path };
    cleanup.release();
  }
  CHECK(std::filesystem::exists(path));
  std::filesystem::remove(path);
}
