#include "cmd_version.h"

#include "platform.h"
#include "tui.h"

#include "CLI11.hpp"
#include "archive.h"
#include "blake3.h"
#include "curl/curl.h"
#include "git2.h"
#include "mbedtls/version.h"
#include "semver.hpp"
#include "sol/sol.hpp"

#include <tbb/version.h>

#include <array>

#ifndef QUARRY_VERSION_STR
#error "QUARRY_VERSION_STR must be defined by the build system"
#endif

namespace quarry {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_version::cmd_version(cfg cfg, global_options /*globals*/) : cfg_{ std::move(cfg) } {}

void cmd_version::execute() {
  tui::print_stdout("quarry %s (%s-%s)\n",
                    QUARRY_VERSION_STR,
                    std::string{ platform::os_name() }.c_str(),
                    std::string{ platform::arch_name() }.c_str());

  tui::info("Third-party component versions:");

  int git_major{ 0 };
  int git_minor{ 0 };
  int git_revision{ 0 };
  git_libgit2_version(&git_major, &git_minor, &git_revision);
  tui::info("  libgit2: %d.%d.%d", git_major, git_minor, git_revision);

  curl_version_info_data const *curl_info{ curl_version_info(CURLVERSION_NOW) };
  tui::info("  libcurl: %s", curl_info->version);

  std::array<char, 32> mbedtls_version{};
  mbedtls_version_get_string_full(mbedtls_version.data());
  tui::info("  mbedTLS: %s", mbedtls_version.data());

  tui::info("  libarchive: %s", archive_version_details());
  tui::info("  Lua: %s", LUA_RELEASE);
  tui::info("  Sol2: %s", SOL_VERSION_STRING);
  tui::info("  oneTBB: %s", TBB_runtime_version());
  tui::info("  BLAKE3: %s", BLAKE3_VERSION_STRING);
  tui::info("  Semver: %d.%d.%d",
            SEMVER_VERSION_MAJOR,
            SEMVER_VERSION_MINOR,
            SEMVER_VERSION_PATCH);
  tui::info("  CLI11: %s", CLI11_VERSION);
}

}  // namespace quarry
