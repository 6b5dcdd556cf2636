#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace uvk {

struct uncopyable {
  uncopyable() = default;
  uncopyable(uncopyable &&) = default;
  uncopyable &operator=(uncopyable &&) = default;
};

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

template <typename... Ts>
struct match : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
match(Ts...) -> match<Ts...>;

// Lowercase hex string of `byte_count` random bytes, for collision-free names.
std::string util_random_hex(size_t byte_count);

// Load entire file as text. Throws std::runtime_error on failure.
std::string util_load_text(std::filesystem::path const &path);

// Write `content` to `path`, truncating. Throws std::system_error on failure.
void util_write_file(std::filesystem::path const &path, std::string_view content);

std::string_view util_trim(std::string_view s);

// Split on any run of spaces, tabs, carriage returns or newlines. Never yields
// empty tokens.
std::vector<std::string> util_split_whitespace(std::string_view s);

// Split on '\n', keeping empty lines; a trailing '\r' is stripped from each line.
std::vector<std::string_view> util_split_lines(std::string_view s);

std::string util_join(std::vector<std::string> const &parts, std::string_view sep);

// Removes a path (file or directory tree) on destruction unless released.
class scoped_path_cleanup : public unmovable {
 public:
  explicit scoped_path_cleanup(std::filesystem::path path);
  ~scoped_path_cleanup();

  void reset(std::filesystem::path path = {});
  void release() { path_.clear(); }
  std::filesystem::path const &path() const { return path_; }

 private:
  void cleanup();

  std::filesystem::path path_;
};

}  // namespace uvk
