#include "util.h"

#include "platform.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <unistd.h>

namespace quarry {

std::string util_bytes_to_hex(void const *data, size_t length) {
  static constexpr char hex_chars[] = "0123456789abcdef";

  auto const bytes = static_cast<unsigned char const *>(data);
  std::string result;
  result.reserve(length * 2);

  for (size_t i{}; i < length; ++i) {
    result += hex_chars[(bytes[i] >> 4) & 0xf];
    result += hex_chars[bytes[i] & 0xf];
  }

  return result;
}

int util_hex_char_to_int(char c) {
  if (c >= '0' && c <= '9') { return c - '0'; }
  if (c >= 'a' && c <= 'f') { return c - 'a' + 10; }
  if (c >= 'A' && c <= 'F') { return c - 'A' + 10; }
  return -1;
}

std::vector<unsigned char> util_hex_to_bytes(std::string const &hex) {
  if (hex.size() % 2 != 0) {
    throw std::runtime_error("util_hex_to_bytes: hex string must have even length, got " +
                             std::to_string(hex.size()));
  }

  std::vector<unsigned char> result;
  result.reserve(hex.size() / 2);

  for (size_t i{}; i < hex.size(); i += 2) {
    int const hi{ util_hex_char_to_int(hex[i]) };
    int const lo{ util_hex_char_to_int(hex[i + 1]) };

    if (hi < 0 || lo < 0) {
      throw std::runtime_error("util_hex_to_bytes: invalid character at position " +
                               std::to_string(hi < 0 ? i : i + 1));
    }

    result.push_back(static_cast<unsigned char>((hi << 4) | lo));
  }

  return result;
}

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
}

std::vector<unsigned char> util_load_file(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::runtime_error("util_load_file: failed to open file: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_END) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to end: " + path.string());
  }

  long const file_size{ std::ftell(file.get()) };
  if (file_size < 0) {
    throw std::runtime_error("util_load_file: failed to get file size: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_SET) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to start: " + path.string());
  }

  std::vector<unsigned char> buffer(static_cast<size_t>(file_size));
  if (file_size > 0) {
    size_t const bytes_read{ std::fread(buffer.data(), 1, buffer.size(), file.get()) };
    if (bytes_read != buffer.size()) {
      throw std::runtime_error("util_load_file: failed to read entire file: " +
                               path.string());
    }
  }

  return buffer;
}

std::string util_load_file_text(std::filesystem::path const &path) {
  auto const bytes{ util_load_file(path) };
  return std::string{ reinterpret_cast<char const *>(bytes.data()), bytes.size() };
}

void util_write_file_atomic(std::filesystem::path const &path, std::string_view content) {
  if (auto const parent{ path.parent_path() }; !parent.empty()) {
    std::filesystem::create_directories(parent);
  }

  std::filesystem::path const tmp{ path.string() + ".tmp." + std::to_string(::getpid()) };
  scoped_path_cleanup tmp_cleanup{ tmp };

  {
    auto file{ util_open_file(tmp, "wb") };
    if (!file) {
      throw std::system_error(errno,
                              std::system_category(),
                              "Failed to open for writing: " + tmp.string());
    }

    if (!content.empty() &&
        std::fwrite(content.data(), 1, content.size(), file.get()) != content.size()) {
      throw std::runtime_error("Failed to write " + tmp.string());
    }

    if (std::fflush(file.get()) != 0 || ::fsync(::fileno(file.get())) != 0) {
      throw std::system_error(errno,
                              std::system_category(),
                              "Failed to flush " + tmp.string());
    }
  }

  platform::atomic_rename(tmp, path);
  tmp_cleanup.reset();
}

std::string_view util_trim(std::string_view s) {
  auto const start{ s.find_first_not_of(" \t\n\r\f\v") };
  if (start == std::string_view::npos) { return {}; }
  return s.substr(start, s.find_last_not_of(" \t\n\r\f\v") - start + 1);
}

std::string util_to_lower(std::string_view s) {
  std::string out{ s };
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
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

}  // namespace quarry
