#include "platform.h"

#include "test_support.h"

#include "doctest.h"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

namespace quarry {

namespace {

class scoped_env : unmovable {
 public:
  scoped_env(char const *name, char const *value) : name_{ name } {
    if (char const *old{ std::getenv(name) }) { old_ = old; }
    if (value) {
      ::setenv(name, value, 1);
    } else {
      ::unsetenv(name);
    }
  }

  ~scoped_env() {
    if (old_) {
      ::setenv(name_.c_str(), old_->c_str(), 1);
    } else {
      ::unsetenv(name_.c_str());
    }
  }

 private:
  std::string name_;
  std::optional<std::string> old_;
};

}  // namespace

TEST_CASE("platform::get_default_cache_root precedence") {
  SUBCASE("explicit override") {
    scoped_env const root{ "QUARRY_CACHE_ROOT", "/tmp/quarry-cache" };
    CHECK(platform::get_default_cache_root() ==
          std::filesystem::path{ "/tmp/quarry-cache" });
  }

#if !defined(__APPLE__)
  SUBCASE("xdg cache home") {
    scoped_env const root{ "QUARRY_CACHE_ROOT", nullptr };
    scoped_env const xdg{ "XDG_CACHE_HOME", "/tmp/xdg" };
    CHECK(platform::get_default_cache_root() == std::filesystem::path{ "/tmp/xdg/quarry" });
  }

  SUBCASE("home fallback") {
    scoped_env const root{ "QUARRY_CACHE_ROOT", nullptr };
    scoped_env const xdg{ "XDG_CACHE_HOME", nullptr };
    scoped_env const home{ "HOME", "/home/someone" };
    CHECK(platform::get_default_cache_root() ==
          std::filesystem::path{ "/home/someone/.cache/quarry" });
  }
#endif

  SUBCASE("nothing set") {
    scoped_env const root{ "QUARRY_CACHE_ROOT", nullptr };
    scoped_env const xdg{ "XDG_CACHE_HOME", nullptr };
    scoped_env const home{ "HOME", nullptr };
    CHECK_FALSE(platform::get_default_cache_root());
  }
}

TEST_CASE_FIXTURE(test::temp_dir_fixture, "platform::find_executable") {
  CHECK(platform::find_executable("sh"));
  CHECK_FALSE(platform::find_executable("quarry-no-such-tool"));
  CHECK_FALSE(platform::find_executable(""));

  auto const script{ write("bin/tool", "#!/bin/sh\n") };
  CHECK_FALSE(platform::find_executable(script.string()));

  std::filesystem::permissions(script,
                               std::filesystem::perms::owner_exec,
                               std::filesystem::perm_options::add);
  CHECK(platform::find_executable(script.string()) == script);

  scoped_env const path{ "PATH", (root / "bin").c_str() };
  CHECK(platform::find_executable("tool") == script);
}

TEST_CASE_FIXTURE(test::temp_dir_fixture, "platform file helpers") {
  auto const marker{ root / "marker" };
  CHECK_FALSE(platform::file_exists(marker));
  platform::touch_file(marker);
  CHECK(platform::file_exists(marker));

  auto const moved{ root / "moved" };
  platform::atomic_rename(marker, moved);
  CHECK_FALSE(platform::file_exists(marker));
  CHECK(platform::file_exists(moved));
  CHECK_THROWS_AS(platform::atomic_rename(marker, moved), std::system_error);

  write("tree/a/b", "x");
  CHECK_FALSE(platform::remove_all_with_retry(root / "tree"));
  CHECK_FALSE(platform::file_exists(root / "tree"));
}

TEST_CASE_FIXTURE(test::temp_dir_fixture, "platform::file_lock excludes other threads") {
  auto const lock_path{ root / "entry.lock" };
  std::atomic_bool acquired{ false };

  std::thread waiter;
  {
    platform::file_lock const held{ lock_path };
    CHECK(static_cast<bool>(held));

    waiter = std::thread{ [&] {
      platform::file_lock const second{ lock_path };
      acquired = true;
    } };

    std::this_thread::sleep_for(std::chrono::milliseconds{ 50 });
    CHECK_FALSE(acquired.load());
  }
  waiter.join();
  CHECK(acquired.load());
}

TEST_CASE("platform identification") {
  CHECK_FALSE(platform::os_name().empty());
  CHECK_FALSE(platform::arch_name().empty());
  CHECK(platform::hardware_concurrency() >= 1);
}

}  // namespace quarry
