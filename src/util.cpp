#include "util.h"

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <random>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace uvk {

namespace {

struct file_closer {
  void operator()(std::FILE *file) const noexcept {
    if (file) { static_cast<void>(std::fclose(file)); }
  }
};

using file_handle = std::unique_ptr<std::FILE, file_closer>;

}  // namespace

std::string util_random_hex(size_t byte_count) {
  static constexpr char kDigits[]{ "0123456789abcdef" };
  thread_local std::mt19937_64 rng{ std::random_device{}() };
  std::uniform_int_distribution<int> nibble{ 0, 15 };

  std::string out(byte_count * 2, '0');
  for (auto &c : out) { c = kDigits[nibble(rng)]; }
  return out;
}

std::string util_load_text(std::filesystem::path const &path) {
  file_handle file{ std::fopen(path.c_str(), "rb") };
  if (!file) {
    throw std::runtime_error("util_load_text: cannot open " + path.string() + ": " +
                             std::strerror(errno));
  }

  std::string text;
  std::array<char, 8192> chunk;
  for (;;) {
    size_t const n{ std::fread(chunk.data(), 1, chunk.size(), file.get()) };
    text.append(chunk.data(), n);
    if (n < chunk.size()) { break; }
  }
  if (std::ferror(file.get())) {
    throw std::runtime_error("util_load_text: read failed: " + path.string());
  }
  return text;
}

void util_write_file(std::filesystem::path const &path, std::string_view content) {
  file_handle file{ std::fopen(path.c_str(), "wb") };
  if (!file) {
    throw std::system_error(errno,
                            std::generic_category(),
                            "Failed to open for writing: " + path.string());
  }

  if (!content.empty() &&
      std::fwrite(content.data(), 1, content.size(), file.get()) != content.size()) {
    throw std::system_error(errno,
                            std::generic_category(),
                            "Failed to write: " + path.string());
  }

  if (std::fflush(file.get()) != 0) {
    throw std::system_error(errno,
                            std::generic_category(),
                            "Failed to flush: " + path.string());
  }
}

std::string_view util_trim(std::string_view s) {
  auto const start{ s.find_first_not_of(" \t\n\r") };
  if (start == std::string_view::npos) { return {}; }
  return s.substr(start, s.find_last_not_of(" \t\n\r") - start + 1);
}

std::vector<std::string> util_split_whitespace(std::string_view s) {
  std::vector<std::string> tokens;
  size_t pos{ 0 };
  while (pos < s.size()) {
    size_t const start{ s.find_first_not_of(" \t\r\n\v\f", pos) };
    if (start == std::string_view::npos) { break; }
    size_t const end{ s.find_first_of(" \t\r\n\v\f", start) };
    size_t const len{ (end == std::string_view::npos ? s.size() : end) - start };
    tokens.emplace_back(s.substr(start, len));
    pos = start + len;
  }
  return tokens;
}

std::vector<std::string_view> util_split_lines(std::string_view s) {
  std::vector<std::string_view> lines;
  size_t line_start{ 0 };
  while (true) {
    size_t const line_end{ s.find('\n', line_start) };
    auto line{ s.substr(
        line_start,
        (line_end == std::string_view::npos ? s.size() : line_end) - line_start) };
    if (!line.empty() && line.back() == '\r') { line.remove_suffix(1); }
    lines.push_back(line);
    if (line_end == std::string_view::npos) { break; }
    line_start = line_end + 1;
  }
  return lines;
}

std::string util_join(std::vector<std::string> const &parts, std::string_view sep) {
  std::string out;
  for (size_t i{ 0 }; i < parts.size(); ++i) {
    if (i > 0) { out.append(sep); }
    out.append(parts[i]);
  }
  return out;
}

scoped_path_cleanup::scoped_path_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

scoped_path_cleanup::~scoped_path_cleanup() { cleanup(); }

void scoped_path_cleanup::reset(std::filesystem::path path) {
  cleanup();
  path_ = std::move(path);
}

void scoped_path_cleanup::cleanup() {
  if (path_.empty()) { return; }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  path_.clear();
}

}  // namespace uvk
