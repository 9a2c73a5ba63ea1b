#pragma once

#include "platform.h"
#include "util.h"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace quarry {

// Content cache rooted at a directory. Every entry is built under an exclusive
// per-entry lock in install/ and promoted to pkg/ with an atomic rename, after which a
// quarry-complete marker makes it visible to readers without taking the lock.
class cache : unmovable {
 public:
  using path = std::filesystem::path;

  class scoped_entry_lock : unmovable {
   public:
    using ptr_t = std::unique_ptr<scoped_entry_lock>;

    static ptr_t make(path entry_dir,
                      platform::file_lock lock,
                      std::string identity,
                      std::chrono::steady_clock::time_point lock_acquired_at);
    ~scoped_entry_lock();

    void mark_install_complete();
    void mark_fetch_complete();
    bool is_install_complete() const;
    bool is_fetch_complete() const;

    path install_dir() const;  // promoted to pkg/ on success
    path fetch_dir() const;    // survives failed attempts so downloads are reused
    path work_dir() const;     // always discarded

   private:
    scoped_entry_lock(path entry_dir,
                      platform::file_lock lock,
                      std::string identity,
                      std::chrono::steady_clock::time_point lock_acquired_at);

    struct impl;
    std::unique_ptr<impl> m;
  };

  struct ensure_result {
    path entry_path;                // entry directory holding pkg/ and the marker
    path pkg_path;                  // entry_path / "pkg"
    scoped_entry_lock::ptr_t lock;  // set when the caller must populate the entry
  };

  explicit cache(std::optional<path> root = std::nullopt);
  ~cache();

  path const &root() const;

  // Fetched source artifacts, keyed by a digest of the source location.
  ensure_result ensure_source(std::string_view key);

  // Lua C headers for one runtime version, e.g. "5.4".
  ensure_result ensure_lua_headers(std::string_view runtime);

  // Registry manifests and rockspecs for one server.
  path registry_dir(std::string_view server) const;

  // Lock-then-recheck acquisition of any entry directory. Also used for install-tree
  // prefixes, whose lock files live beside the entry.
  static ensure_result ensure_entry(path const &entry_dir,
                                    path const &lock_path,
                                    std::string_view identity);

  static bool is_entry_complete(path const &entry_dir);

 private:
  struct impl;
  std::unique_ptr<impl> m;
};

}  // namespace quarry
