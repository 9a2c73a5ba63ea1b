#include "sha256.h"

#include "mbedtls/sha256.h"

#include <cstdio>
#include <stdexcept>
#include <vector>

namespace quarry {

struct sha256_hasher::impl {
  mbedtls_sha256_context ctx;
  bool finished{ false };
};

sha256_hasher::sha256_hasher() : m{ std::make_unique<impl>() } {
  mbedtls_sha256_init(&m->ctx);
  if (mbedtls_sha256_starts(&m->ctx, 0)) {
    mbedtls_sha256_free(&m->ctx);
    throw std::runtime_error("sha256: mbedtls_sha256_starts failed");
  }
}

sha256_hasher::~sha256_hasher() { mbedtls_sha256_free(&m->ctx); }

void sha256_hasher::update(void const *data, size_t length) {
  if (m->finished) { throw std::logic_error("sha256: update after finish"); }
  if (length == 0) { return; }
  if (mbedtls_sha256_update(&m->ctx, static_cast<unsigned char const *>(data), length)) {
    throw std::runtime_error("sha256: mbedtls_sha256_update failed");
  }
}

void sha256_hasher::update_file(std::filesystem::path const &file_path) {
  file_ptr_t file{ util_open_file(file_path, "rb") };
  if (!file) {
    throw std::runtime_error("sha256: failed to open file: " + file_path.string());
  }

  std::vector<unsigned char> buffer(1024 * 1024);
  while (true) {
    auto const read_bytes{
      std::fread(buffer.data(), sizeof(unsigned char), buffer.size(), file.get())
    };

    if (read_bytes > 0) { update(buffer.data(), read_bytes); }

    if (read_bytes < buffer.size()) {
      if (std::ferror(file.get())) { throw std::runtime_error("sha256: fread failed"); }
      break;
    }
  }
}

sha256_t sha256_hasher::finish() {
  if (m->finished) { throw std::logic_error("sha256: finish called twice"); }
  m->finished = true;

  sha256_t digest{};
  if (mbedtls_sha256_finish(&m->ctx, digest.data())) {
    throw std::runtime_error("sha256: mbedtls_sha256_finish failed");
  }
  return digest;
}

sha256_t sha256(std::filesystem::path const &file_path) {
  if (!std::filesystem::exists(file_path)) {
    throw std::runtime_error("sha256: file does not exist: " + file_path.string());
  }

  sha256_hasher hasher;
  hasher.update_file(file_path);
  return hasher.finish();
}

sha256_t sha256_bytes(void const *data, size_t length) {
  sha256_hasher hasher;
  hasher.update(data, length);
  return hasher.finish();
}

std::string sha256_hex(sha256_t const &digest) {
  return util_bytes_to_hex(digest.data(), digest.size());
}

}  // namespace quarry
