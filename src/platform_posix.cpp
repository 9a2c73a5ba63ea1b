#include "platform.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>

namespace quarry::platform {

struct file_lock::impl {
  int fd;
  std::mutex *path_mutex;  // owned by the s_lock_mutexes map
  std::filesystem::path lock_path;

  // POSIX record locks are per-process; the per-path mutex gives thread exclusion.
  static std::mutex s_lock_map_mutex;
  static std::unordered_map<std::string, std::unique_ptr<std::mutex> > s_lock_mutexes;
};

std::mutex file_lock::impl::s_lock_map_mutex;
std::unordered_map<std::string, std::unique_ptr<std::mutex> >
    file_lock::impl::s_lock_mutexes;

file_lock::file_lock(std::filesystem::path const &path) {
  std::string const canonical_key{
    std::filesystem::absolute(path).lexically_normal().string()
  };

  std::unique_lock<std::mutex> path_lock{ [&]() {
    std::lock_guard<std::mutex> lock(impl::s_lock_map_mutex);
    auto &mutex_ptr{ impl::s_lock_mutexes[canonical_key] };
    if (!mutex_ptr) { mutex_ptr = std::make_unique<std::mutex>(); }
    return std::unique_lock<std::mutex>{ *mutex_ptr };
  }() };

  int const fd{ ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0666) };
  if (fd == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to open lock file: " + path.string());
  }

  struct flock fl{ .l_type = F_WRLCK,
                   .l_whence = SEEK_SET,
                   .l_start = 0,
                   .l_len = 0,
                   .l_pid = 0 };

  while (::fcntl(fd, F_SETLKW, &fl) == -1) {
    if (errno == EINTR) { continue; }
    int const err{ errno };
    ::close(fd);
    throw std::system_error(err,
                            std::system_category(),
                            "Failed to acquire exclusive lock: " + path.string());
  }

  impl_ = std::make_unique<impl>();
  impl_->fd = fd;
  impl_->path_mutex = path_lock.release();  // mutex stays locked until destruction
  impl_->lock_path = path;
}

file_lock::~file_lock() {
  if (impl_) {
    ::close(impl_->fd);
    if (impl_->path_mutex) { impl_->path_mutex->unlock(); }
  }
}

file_lock::file_lock(file_lock &&) noexcept = default;
file_lock &file_lock::operator=(file_lock &&) noexcept = default;

file_lock::operator bool() const { return impl_ != nullptr; }

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to) {
  if (::rename(from.c_str(), to.c_str()) != 0) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to rename " + from.string() + " to " + to.string());
  }
}

void touch_file(std::filesystem::path const &path) {
  int const fd{ ::open(path.c_str(), O_CREAT | O_WRONLY | O_CLOEXEC, 0644) };
  if (fd == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to touch file: " + path.string());
  }
  ::close(fd);
}

bool file_exists(std::filesystem::path const &path) {
  return std::filesystem::exists(path);
}

std::error_code remove_all_with_retry(std::filesystem::path const &target) {
  // Unlinking works with open handles on POSIX; no retry needed.
  std::error_code ec;
  std::filesystem::remove_all(target, ec);
  return ec;
}

std::optional<std::filesystem::path> get_default_cache_root() {
  if (char const *env_root{ std::getenv("QUARRY_CACHE_ROOT") }) {
    return std::filesystem::path{ env_root };
  }

#ifdef __APPLE__
  if (char const *home{ std::getenv("HOME") }) {
    return std::filesystem::path{ home } / "Library" / "Caches" / "quarry";
  }
#else
  if (char const *xdg_cache{ std::getenv("XDG_CACHE_HOME") }) {
    return std::filesystem::path{ xdg_cache } / "quarry";
  }

  if (char const *home{ std::getenv("HOME") }) {
    return std::filesystem::path{ home } / ".cache" / "quarry";
  }
#endif

  return std::nullopt;
}

char const *get_default_cache_root_env_vars() {
#ifdef __APPLE__
  return "QUARRY_CACHE_ROOT or HOME";
#else
  return "QUARRY_CACHE_ROOT, XDG_CACHE_HOME or HOME";
#endif
}

std::optional<std::filesystem::path> find_executable(std::string_view name) {
  if (name.empty()) { return std::nullopt; }

  auto const is_executable{ [](std::filesystem::path const &p) {
    struct stat st{};
    return ::stat(p.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
           ::access(p.c_str(), X_OK) == 0;
  } };

  if (name.find('/') != std::string_view::npos) {
    std::filesystem::path const p{ name };
    if (is_executable(p)) { return p; }
    return std::nullopt;
  }

  char const *path_env{ std::getenv("PATH") };
  std::string_view remaining{ path_env ? path_env : "/usr/bin:/bin" };
  while (!remaining.empty()) {
    auto const colon{ remaining.find(':') };
    auto const dir{ remaining.substr(0, colon) };
    remaining = colon == std::string_view::npos ? std::string_view{}
                                                : remaining.substr(colon + 1);
    if (dir.empty()) { continue; }

    auto const candidate{ std::filesystem::path{ dir } / name };
    if (is_executable(candidate)) { return candidate; }
  }

  return std::nullopt;
}

std::string_view os_name() {
#if defined(__APPLE__) && defined(__MACH__)
  return "macosx";
#elif defined(__linux__)
  return "linux";
#else
  return "unix";
#endif
}

std::string_view arch_name() {
#if defined(__aarch64__) || defined(__arm64__)
  return "aarch64";
#elif defined(__x86_64__)
  return "x86_64";
#else
  return "unknown";
#endif
}

unsigned hardware_concurrency() {
  unsigned const n{ std::thread::hardware_concurrency() };
  return n == 0 ? 1 : n;
}

bool is_tty() { return ::isatty(::fileno(stderr)) != 0; }

}  // namespace quarry::platform
