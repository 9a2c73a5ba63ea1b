#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace quarry {

struct extract_options {
  int strip_components{ 0 };
  std::atomic_bool const *cancel{ nullptr };
};

// Unpacks any libarchive-readable archive into `destination`. Entries that would land
// outside `destination` are refused. Returns the number of regular files written.
std::uint64_t extract(std::filesystem::path const &archive_path,
                      std::filesystem::path const &destination,
                      extract_options const &options = {});

bool extract_is_archive_extension(std::filesystem::path const &path);

// Lays out a fetched artifact as a source tree under `destination`: archives are
// unpacked, directories are copied, and plain files are copied by name. Returns the
// source root, which is `destination/<subdir>` when given, otherwise the single
// top-level directory an archive unpacked into, otherwise `destination` itself.
std::filesystem::path extract_source(std::filesystem::path const &artifact,
                                     std::filesystem::path const &destination,
                                     std::optional<std::string> const &subdir = {},
                                     extract_options const &options = {});

}  // namespace quarry
