#pragma once

#include "util.h"

#include <array>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace quarry {

using sha256_t = std::array<unsigned char, 32>;

// Incremental sha256 over mbedtls.
class sha256_hasher : unmovable {
 public:
  sha256_hasher();
  ~sha256_hasher();

  void update(void const *data, size_t length);
  void update(std::string_view bytes) { update(bytes.data(), bytes.size()); }
  void update_file(std::filesystem::path const &file_path);

  sha256_t finish();

 private:
  struct impl;
  std::unique_ptr<impl> m;
};

sha256_t sha256(std::filesystem::path const &file_path);
sha256_t sha256_bytes(void const *data, size_t length);

std::string sha256_hex(sha256_t const &digest);

}  // namespace quarry
