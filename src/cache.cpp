#include "cache.h"

#include "blake3_util.h"
#include "platform.h"
#include "tui.h"

#include <chrono>
#include <stdexcept>
#include <system_error>

using path = std::filesystem::path;

namespace quarry {

namespace {

constexpr char const *kCompleteMarker{ "quarry-complete" };

void remove_all_logged(path const &target) {
  std::error_code ec;
  std::filesystem::remove_all(target, ec);
  if (ec) {
    tui::error("Failed to remove %s: %s", target.c_str(), ec.message().c_str());
  }
}

bool dir_is_empty(path const &dir) {
  std::error_code ec;
  std::filesystem::directory_iterator it{ dir, ec };
  if (ec) { return false; }
  return it == std::filesystem::directory_iterator{};
}

}  // namespace

struct cache::impl {
  path root_;

  path sources_dir() const { return root_ / "sources"; }
  path headers_dir() const { return root_ / "lua-headers"; }
  path locks_dir() const { return root_ / "locks"; }
};

struct cache::scoped_entry_lock::impl {
  path entry_dir_;
  platform::file_lock lock_;
  std::string identity_;
  std::chrono::steady_clock::time_point lock_acquired_time{};
  bool completed_{ false };

  path pkg_dir() const { return entry_dir_ / "pkg"; }
};

cache::scoped_entry_lock::scoped_entry_lock(
    path entry_dir,
    platform::file_lock lock,
    std::string identity,
    std::chrono::steady_clock::time_point lock_acquired_at)
    : m{ std::make_unique<impl>(impl{ .entry_dir_ = std::move(entry_dir),
                                      .lock_ = std::move(lock),
                                      .identity_ = std::move(identity),
                                      .lock_acquired_time = lock_acquired_at }) } {
  remove_all_logged(install_dir());
  remove_all_logged(work_dir());

  std::filesystem::create_directories(fetch_dir());
  std::filesystem::create_directories(install_dir());
  std::filesystem::create_directories(work_dir());
  tui::debug("entry lock acquired: %s", m->identity_.c_str());
}

cache::scoped_entry_lock::~scoped_entry_lock() {
  auto const held_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::steady_clock::now() - m->lock_acquired_time)
                          .count() };

  if (m->completed_) {
    try {
      remove_all_logged(m->pkg_dir());
      platform::atomic_rename(install_dir(), m->pkg_dir());
      remove_all_logged(work_dir());
      remove_all_logged(fetch_dir());
      platform::touch_file(m->entry_dir_ / kCompleteMarker);
    } catch (std::exception const &e) {
      tui::error("Failed to promote %s: %s", m->entry_dir_.c_str(), e.what());
    }
  } else {
    bool const nothing_produced{ dir_is_empty(install_dir()) && dir_is_empty(fetch_dir()) };
    remove_all_logged(install_dir());
    remove_all_logged(work_dir());
    if (nothing_produced) { remove_all_logged(fetch_dir()); }
  }

  tui::debug("entry lock released: %s (%s after %lldms)",
             m->identity_.c_str(),
             m->completed_ ? "complete" : "abandoned",
             static_cast<long long>(held_ms));
}

cache::scoped_entry_lock::ptr_t cache::scoped_entry_lock::make(
    path entry_dir,
    platform::file_lock lock,
    std::string identity,
    std::chrono::steady_clock::time_point lock_acquired_at) {
  return ptr_t{ new scoped_entry_lock{ std::move(entry_dir),
                                       std::move(lock),
                                       std::move(identity),
                                       lock_acquired_at } };
}

void cache::scoped_entry_lock::mark_install_complete() { m->completed_ = true; }

void cache::scoped_entry_lock::mark_fetch_complete() {
  std::filesystem::create_directories(fetch_dir());
  platform::touch_file(fetch_dir() / kCompleteMarker);
}

bool cache::scoped_entry_lock::is_install_complete() const { return m->completed_; }

bool cache::scoped_entry_lock::is_fetch_complete() const {
  return platform::file_exists(fetch_dir() / kCompleteMarker);
}

cache::path cache::scoped_entry_lock::install_dir() const {
  return m->entry_dir_ / "install";
}
cache::path cache::scoped_entry_lock::fetch_dir() const { return m->entry_dir_ / "fetch"; }
cache::path cache::scoped_entry_lock::work_dir() const { return m->entry_dir_ / "work"; }

cache::cache(std::optional<path> root) : m{ std::make_unique<impl>() } {
  if (std::optional<path> maybe_root{ root ? root : platform::get_default_cache_root() }) {
    m->root_ = *maybe_root;
    return;
  }

  throw std::runtime_error(std::string{ "Unable to determine default cache root: " } +
                           platform::get_default_cache_root_env_vars() + " not set");
}

cache::~cache() = default;

path const &cache::root() const { return m->root_; }

bool cache::is_entry_complete(path const &entry_dir) {
  return platform::file_exists(entry_dir / kCompleteMarker);
}

cache::ensure_result cache::ensure_entry(path const &entry_dir,
                                         path const &lock_path,
                                         std::string_view identity) {
  ensure_result result{ .entry_path = entry_dir,
                        .pkg_path = entry_dir / "pkg",
                        .lock = nullptr };

  if (is_entry_complete(entry_dir)) { return result; }

  std::filesystem::create_directories(lock_path.parent_path());
  std::filesystem::create_directories(entry_dir);

  auto const wait_start{ std::chrono::steady_clock::now() };
  platform::file_lock lock{ lock_path };
  auto const acquired_at{ std::chrono::steady_clock::now() };
  tui::debug("waited %lldms for %s",
             static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                        acquired_at - wait_start)
                                        .count()),
             lock_path.c_str());

  // Another thread or process may have finished the entry while we waited.
  if (is_entry_complete(entry_dir)) { return result; }

  result.lock = scoped_entry_lock::make(entry_dir,
                                        std::move(lock),
                                        std::string{ identity },
                                        acquired_at);
  return result;
}

cache::ensure_result cache::ensure_source(std::string_view key) {
  std::string const k{ key };
  return ensure_entry(m->sources_dir() / k, m->locks_dir() / ("source." + k + ".lock"), k);
}

cache::ensure_result cache::ensure_lua_headers(std::string_view runtime) {
  std::string const r{ runtime };
  return ensure_entry(m->headers_dir() / r,
                      m->locks_dir() / ("lua-headers." + r + ".lock"),
                      "lua-headers-" + r);
}

cache::path cache::registry_dir(std::string_view server) const {
  return m->root_ / "registry" / blake3_key(server);
}

}  // namespace quarry
