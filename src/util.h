#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace quarry {

template <typename T, typename... Types>
concept one_of = (std::same_as<T, Types> || ...);

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

// Convert bytes to lowercase hex string
std::string util_bytes_to_hex(void const *data, size_t length);

// Convert hex string to bytes (case-insensitive)
std::vector<unsigned char> util_hex_to_bytes(std::string const &hex);

// Convert single hex character to value (0-15). Returns -1 if invalid.
int util_hex_char_to_int(char c);

// RAII file pointer with custom deleter
struct file_deleter {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

// Open file with RAII wrapper. Returns nullptr on failure.
file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Load entire file into memory as bytes.
// Throws std::runtime_error if file cannot be opened or read.
std::vector<unsigned char> util_load_file(std::filesystem::path const &path);
std::string util_load_file_text(std::filesystem::path const &path);

// Write `content` to a sibling temp file, flush, then rename over `path`. Readers see
// either the old file or the new one, never a truncated mix.
void util_write_file_atomic(std::filesystem::path const &path, std::string_view content);

std::string_view util_trim(std::string_view s);
std::string util_to_lower(std::string_view s);

// Replace $(NAME) references using `lookup`; unknown names expand to "".
template <typename lookup_fn>
std::string util_substitute_vars(std::string_view text, lookup_fn const &lookup) {
  std::string out;
  out.reserve(text.size());
  for (size_t i{ 0 }; i < text.size();) {
    if (text[i] == '$' && i + 1 < text.size() && text[i + 1] == '(') {
      auto const close{ text.find(')', i + 2) };
      if (close != std::string_view::npos) {
        out += lookup(std::string{ text.substr(i + 2, close - i - 2) });
        i = close + 1;
        continue;
      }
    }
    out += text[i++];
  }
  return out;
}

class scoped_path_cleanup : public unmovable {
 public:
  explicit scoped_path_cleanup(std::filesystem::path path);
  ~scoped_path_cleanup();

  void reset(std::filesystem::path path = {});
  std::filesystem::path const &path() const { return path_; }

 private:
  void cleanup();

  std::filesystem::path path_;
};

}  // namespace quarry
