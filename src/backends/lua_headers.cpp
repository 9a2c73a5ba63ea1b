#include "backends/lua_headers.h"

#include "backends/external_deps.h"
#include "cache.h"
#include "errors.h"
#include "extract.h"
#include "fetch.h"
#include "integrity.h"
#include "platform.h"
#include "tui.h"
#include "uri.h"
#include "util.h"

#include <array>
#include <map>
#include <regex>
#include <vector>

namespace quarry {

namespace {

struct lua_release {
  std::string release;
  std::string sha256;  // of the lua.org tarball
};

std::map<std::string, lua_release> const kLatest{
  { "5.1", { "5.1.5", "2640fc56a795f29d28ef15e13c34a47e223960b0240e8cb0a82d9b0738695333" } },
  { "5.2", { "5.2.4", "b9e2e4aad6789b3b63a056d442f7b39f0ecfca3ae0f1fc0ae4e9614401b69f4b" } },
  { "5.3", { "5.3.6", "fc5fd69bb8736323f026672b1b7235da613d7177e72558893a0bdcd320466d60" } },
  { "5.4", { "5.4.7", "9fbf5e28ef86c69858f6d3d34eccc32e911c1a28b4120ff3e84aaa70cfbf1e30" } },
};

constexpr std::array<char const *, 5> kHeaderFiles{ "lua.h",
                                                    "luaconf.h",
                                                    "lualib.h",
                                                    "lauxlib.h",
                                                    "lua.hpp" };

bool matches(std::filesystem::path const &incdir, std::string const &runtime) {
  auto const lua_h{ incdir / "lua.h" };
  if (!platform::file_exists(lua_h)) { return false; }
  auto const found{ lua_headers_version(lua_h) };
  if (found != runtime) {
    tui::debug("ignoring %s: Lua %s, want %s",
               lua_h.c_str(),
               found.value_or("?").c_str(),
               runtime.c_str());
    return false;
  }
  return true;
}

std::vector<std::string> pkg_config_names(std::string const &runtime) {
  std::string compact{ runtime };
  std::erase(compact, '.');
  return { "lua" + runtime, "lua-" + runtime, "lua" + compact };
}

std::vector<std::filesystem::path> standard_incdirs(std::string const &runtime) {
  std::string compact{ runtime };
  std::erase(compact, '.');
  std::vector<std::filesystem::path> out;
  for (char const *prefix :
       { "/usr/include", "/usr/local/include", "/opt/homebrew/include" }) {
    std::filesystem::path const p{ prefix };
    out.push_back(p / ("lua" + runtime));
    out.push_back(p / ("lua-" + runtime));
    out.push_back(p / ("lua" + compact));
    out.push_back(p / "lua");
    out.push_back(p);
  }
  return out;
}

std::filesystem::path populate_cached_headers(cache &c,
                                              std::string const &runtime,
                                              variable_map const &vars,
                                              std::atomic_bool const *cancel) {
  auto ensured{ c.ensure_lua_headers(runtime) };
  if (ensured.lock) {
    auto const it{ vars.find("LUA_HEADERS_URL") };
    auto const url{ it != vars.end() && !it->second.empty()
                        ? it->second
                        : lua_headers_default_url(runtime) };
    tui::info("Downloading Lua %s headers from %s", runtime.c_str(), url.c_str());

    auto const name{ uri_extract_filename(url) };
    auto const archive{ ensured.lock->fetch_dir() /
                        (name.empty() ? std::string{ "lua.tar.gz" } : name) };
    fetch_single(fetch_request_for(url, archive, "", std::nullopt),
                 http_options{ .cancel = cancel });
    if (auto const expected{ lua_headers_expected_hash(runtime, url, vars) }) {
      integrity::verify(*expected, integrity::of_file(archive), url);
    } else {
      tui::warn("No digest known for %s; set LUA_HEADERS_HASH to check it", url.c_str());
    }

    auto const work{ ensured.lock->work_dir() };
    extract(archive, work, extract_options{ .strip_components = 1, .cancel = cancel });

    auto const include{ ensured.lock->install_dir() / "include" };
    std::filesystem::create_directories(include);
    for (auto const *header : kHeaderFiles) {
      for (auto const &dir : { work / "src", work }) {
        if (platform::file_exists(dir / header)) {
          std::filesystem::copy_file(dir / header,
                                     include / header,
                                     std::filesystem::copy_options::overwrite_existing);
          break;
        }
      }
    }
    if (!platform::file_exists(include / "lua.h")) {
      throw header_not_found(url + " has no lua.h");
    }
    ensured.lock->mark_install_complete();
    ensured.lock.reset();
  }
  return ensured.pkg_path / "include";
}

}  // namespace

std::optional<std::string> lua_headers_version(std::filesystem::path const &lua_h) {
  auto const text{ util_load_file_text(lua_h) };
  static std::regex const major_re{ R"re(#define\s+LUA_VERSION_MAJOR(?:_N)?\s+"?(\d+)"?)re" };
  static std::regex const minor_re{ R"re(#define\s+LUA_VERSION_MINOR(?:_N)?\s+"?(\d+)"?)re" };
  static std::regex const legacy_re{ R"(#define\s+LUA_VERSION\s+"Lua (\d+)\.(\d+))" };

  std::smatch major, minor;
  if (std::regex_search(text, major, major_re) && std::regex_search(text, minor, minor_re)) {
    return major[1].str() + "." + minor[1].str();
  }
  std::smatch legacy;
  if (std::regex_search(text, legacy, legacy_re)) {
    return legacy[1].str() + "." + legacy[2].str();
  }
  return std::nullopt;
}

std::string lua_headers_default_url(std::string const &runtime) {
  auto const it{ kLatest.find(runtime) };
  auto const full{ it == kLatest.end() ? runtime + ".0" : it->second.release };
  return "https://www.lua.org/ftp/lua-" + full + ".tar.gz";
}

std::optional<std::string> lua_headers_expected_hash(std::string const &runtime,
                                                     std::string const &url,
                                                     variable_map const &vars) {
  if (auto const it{ vars.find("LUA_HEADERS_HASH") };
      it != vars.end() && !it->second.empty()) {
    return integrity::normalize(it->second);
  }
  auto const it{ kLatest.find(runtime) };
  if (it == kLatest.end() || url != lua_headers_default_url(runtime)) { return std::nullopt; }
  return integrity::normalize(it->second.sha256);
}

lua_headers lua_headers_find(std::string const &runtime,
                             variable_map const &vars,
                             cache *header_cache,
                             std::atomic_bool const *cancel) {
  if (auto const it{ vars.find("LUA_INCDIR") }; it != vars.end() && !it->second.empty()) {
    if (matches(it->second, runtime)) { return { it->second, "LUA_INCDIR" }; }
  }

  for (auto const &name : pkg_config_names(runtime)) {
    auto const flags{ external_deps_pkg_config({ "--cflags-only-I", name }, cancel) };
    if (!flags) { continue; }
    for (auto const &dir : external_deps_flag_values(*flags, "-I")) {
      if (matches(dir, runtime)) { return { dir, "pkg-config " + name }; }
    }
    auto const includedir{ external_deps_pkg_config({ "--variable=includedir", name },
                                                    cancel) };
    if (includedir) {
      std::filesystem::path const dir{ std::string{ util_trim(*includedir) } };
      if (matches(dir, runtime)) { return { dir, "pkg-config " + name }; }
    }
  }

  for (auto const &dir : standard_incdirs(runtime)) {
    if (matches(dir, runtime)) { return { dir, dir.string() }; }
  }

  if (!header_cache) {
    throw header_not_found("no lua.h for Lua " + runtime + " and no header cache");
  }

  try {
    auto const dir{ populate_cached_headers(*header_cache, runtime, vars, cancel) };
    if (!matches(dir, runtime)) {
      throw header_not_found("cached headers in " + dir.string() + " are not Lua " +
                             runtime);
    }
    return { dir, "cache" };
  } catch (header_not_found const &) {
    throw;
  } catch (integrity_violation const &) {
    throw;
  } catch (cancelled const &) {
    throw;
  } catch (std::exception const &e) {
    throw header_not_found("Lua " + runtime + ": " + e.what());
  }
}

}  // namespace quarry
