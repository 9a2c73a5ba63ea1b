#include "tree.h"

#include "platform.h"
#include "tui.h"

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <tuple>

namespace quarry {

namespace {

// "ns/name" keeps a flat directory name.
std::string entry_name(std::string const &name, std::string const &version) {
  std::string out{ name + "@" + version };
  std::ranges::replace(out, '/', '_');
  return out;
}

std::string join(std::vector<std::string> const &parts, char sep) {
  std::string out;
  for (auto const &p : parts) {
    if (!out.empty()) { out += sep; }
    out += p;
  }
  return out;
}

}  // namespace

tree::tree(std::filesystem::path root, std::string runtime, std::string lib_extension)
    : root_{ std::filesystem::absolute(root).lexically_normal() },
      runtime_{ std::move(runtime) },
      lib_extension_{ std::move(lib_extension) } {
  if (runtime_.empty()) { throw std::invalid_argument("tree: runtime is empty"); }
}

std::filesystem::path tree::entry_dir(std::string const &name,
                                      std::string const &version) const {
  return runtime_dir() / entry_name(name, version);
}

cache::ensure_result tree::ensure_package(std::string const &name,
                                          std::string const &version) {
  auto const id{ entry_name(name, version) };
  return cache::ensure_entry(entry_dir(name, version), locks_dir() / (id + ".lock"), id);
}

bool tree::installed(std::string const &name, std::string const &version) const {
  return cache::is_entry_complete(entry_dir(name, version));
}

void tree::remove(std::string const &name, std::string const &version) {
  auto const id{ entry_name(name, version) };
  auto const dir{ entry_dir(name, version) };
  if (!std::filesystem::exists(dir)) { return; }

  std::filesystem::create_directories(locks_dir());
  platform::file_lock const lock{ locks_dir() / (id + ".lock") };
  if (auto const ec{ platform::remove_all_with_retry(dir) }) {
    throw std::system_error(ec, "Failed to remove " + dir.string());
  }
  tui::debug("removed %s", dir.c_str());
}

std::vector<installed_package> tree::packages() const {
  std::vector<installed_package> out;
  std::error_code ec;
  for (std::filesystem::directory_iterator it{ runtime_dir(), ec }, end; !ec && it != end;
       it.increment(ec)) {
    if (!it->is_directory()) { continue; }
    auto const dirname{ it->path().filename().string() };
    auto const at{ dirname.rfind('@') };
    if (at == std::string::npos || at == 0) { continue; }
    if (!cache::is_entry_complete(it->path())) { continue; }
    out.push_back({ .name = dirname.substr(0, at),
                    .version = dirname.substr(at + 1),
                    .pkg_path = it->path() / "pkg" });
  }
  std::ranges::sort(out, [](auto const &a, auto const &b) {
    return std::tie(a.name, a.version) < std::tie(b.name, b.version);
  });
  return out;
}

std::string tree::lua_path() const {
  std::vector<std::string> parts;
  for (auto const &p : packages()) {
    auto const lua{ (p.pkg_path / "lua").string() };
    parts.push_back(lua + "/?.lua");
    parts.push_back(lua + "/?/init.lua");
  }
  return join(parts, ';');
}

std::string tree::lua_cpath() const {
  std::vector<std::string> parts;
  for (auto const &p : packages()) {
    parts.push_back((p.pkg_path / "lib").string() + "/?." + lib_extension_);
  }
  return join(parts, ';');
}

std::string tree::bin_path() const {
  std::vector<std::string> parts;
  for (auto const &p : packages()) {
    if (std::filesystem::is_directory(p.pkg_path / "bin")) {
      parts.push_back((p.pkg_path / "bin").string());
    }
  }
  return join(parts, ':');
}

}  // namespace quarry
