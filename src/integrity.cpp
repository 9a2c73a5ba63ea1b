#include "integrity.h"

#include "errors.h"
#include "util.h"

#include "mbedtls/base64.h"

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace quarry::integrity {

namespace {

constexpr std::string_view kPrefix{ "sha256-" };

std::string base64_encode(unsigned char const *data, size_t length) {
  size_t needed{ 0 };
  mbedtls_base64_encode(nullptr, 0, &needed, data, length);

  std::string out(needed, '\0');
  size_t written{ 0 };
  if (mbedtls_base64_encode(reinterpret_cast<unsigned char *>(out.data()),
                            out.size(),
                            &written,
                            data,
                            length)) {
    throw std::runtime_error("integrity: base64 encoding failed");
  }
  out.resize(written);
  return out;
}

bool base64_decodes_to_digest(std::string_view b64) {
  unsigned char buf[64];
  size_t written{ 0 };
  return mbedtls_base64_decode(buf,
                               sizeof buf,
                               &written,
                               reinterpret_cast<unsigned char const *>(b64.data()),
                               b64.size()) == 0 &&
         written == sizeof(sha256_t);
}

}  // namespace

std::string from_digest(sha256_t const &digest) {
  return std::string{ kPrefix } + base64_encode(digest.data(), digest.size());
}

std::string of_bytes(std::string_view bytes) {
  return from_digest(sha256_bytes(bytes.data(), bytes.size()));
}

std::string of_file(std::filesystem::path const &file) { return from_digest(sha256(file)); }

std::string of_path(std::filesystem::path const &path) {
  namespace fs = std::filesystem;

  if (!fs::is_directory(path)) { return of_file(path); }

  std::vector<std::string> files;
  for (auto it{ fs::recursive_directory_iterator(path) };
       it != fs::recursive_directory_iterator();
       ++it) {
    if (it->is_directory() && it->path().filename() == ".git") {
      it.disable_recursion_pending();
      continue;
    }
    if (it->is_regular_file()) {
      files.push_back(fs::relative(it->path(), path).generic_string());
    }
  }
  std::ranges::sort(files);

  sha256_hasher hasher;
  for (auto const &rel : files) {
    hasher.update(rel);
    hasher.update("\0", 1);
    hasher.update_file(path / rel);
  }
  return from_digest(hasher.finish());
}

std::string normalize(std::string_view text) {
  auto const trimmed{ util_trim(text) };

  if (trimmed.starts_with(kPrefix)) {
    if (!base64_decodes_to_digest(trimmed.substr(kPrefix.size()))) {
      throw parse_error("invalid sha256 integrity string", kPrefix.size(), trimmed);
    }
    return std::string{ trimmed };
  }

  if (trimmed.size() == 64 &&
      std::ranges::all_of(trimmed, [](char c) { return util_hex_char_to_int(c) >= 0; })) {
    auto const bytes{ util_hex_to_bytes(std::string{ trimmed }) };
    sha256_t digest{};
    std::ranges::copy(bytes, digest.begin());
    return from_digest(digest);
  }

  throw parse_error("unsupported integrity format (expected sha256-<base64>)", 0, trimmed);
}

void verify(std::string_view expected, std::string_view actual, std::string const &subject) {
  auto const want{ normalize(expected) };
  auto const got{ normalize(actual) };
  if (want != got) { throw integrity_violation(subject, want, got); }
}

}  // namespace quarry::integrity
