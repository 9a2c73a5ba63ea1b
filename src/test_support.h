#pragma once

// Helpers shared by unit tests. Compiled only into quarry_unit_tests.

#include "manifest_client.h"

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace quarry::test {

// Fresh directory under the system temp dir, removed on destruction.
struct temp_dir_fixture {
  temp_dir_fixture();
  ~temp_dir_fixture();

  // Writes `content` to root / rel, creating parent directories.
  std::filesystem::path write(std::filesystem::path const &rel,
                              std::string_view content) const;
  std::string read(std::filesystem::path const &rel) const;

  std::filesystem::path root;
};

using archive_entries_t = std::vector<std::pair<std::string, std::string>>;

// Writes a gzip-compressed tarball of (relative path, content) regular files.
void write_tar_gz(std::filesystem::path const &archive_path,
                  archive_entries_t const &entries);

// In-memory package index. Descriptors are parsed from generated rockspec text.
class fake_registry : public manifest_client {
 public:
  // `extra` is appended to the rockspec body, so it may override `source` or add
  // `build`.
  void add(std::string const &name,
           std::string const &ver,
           std::vector<std::string> const &deps = {},
           std::string const &extra = {});

  std::vector<version> list_versions(std::string const &name) override;
  descriptor_ptr fetch_descriptor(std::string const &name, version const &v) override;

  int descriptor_fetches() const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::map<version, descriptor_ptr>> index_;
  int fetches_{ 0 };
};

}  // namespace quarry::test
