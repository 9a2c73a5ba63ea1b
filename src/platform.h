#pragma once

#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
#include <system_error>

namespace quarry::platform {

// Exclusive advisory lock on a lock file, held for the object's lifetime. Excludes other
// threads in this process as well as other processes.
class file_lock : uncopyable {
 public:
  explicit file_lock(std::filesystem::path const &path);
  ~file_lock();
  file_lock(file_lock &&) noexcept;
  file_lock &operator=(file_lock &&) noexcept;

  explicit operator bool() const;

 private:
  struct impl;
  std::unique_ptr<impl> impl_;
};

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to);
void touch_file(std::filesystem::path const &path);
bool file_exists(std::filesystem::path const &path);
std::error_code remove_all_with_retry(std::filesystem::path const &target);

std::optional<std::filesystem::path> get_default_cache_root();
char const *get_default_cache_root_env_vars();

// Search PATH for an executable. Names containing '/' are checked as-is.
std::optional<std::filesystem::path> find_executable(std::string_view name);

std::string_view os_name();
std::string_view arch_name();
unsigned hardware_concurrency();

bool is_tty();

}  // namespace quarry::platform
