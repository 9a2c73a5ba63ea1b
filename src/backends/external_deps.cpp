#include "backends/external_deps.h"

#include "errors.h"
#include "platform.h"
#include "shell.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace quarry {

namespace {

std::string var_prefix(std::string const &name) {
  std::string out;
  for (char const c : name) {
    out += std::isalnum(static_cast<unsigned char>(c))
               ? static_cast<char>(std::toupper(static_cast<unsigned char>(c)))
               : '_';
  }
  return out;
}

std::optional<std::string> lookup(variable_map const &vars, std::string const &key) {
  auto const it{ vars.find(key) };
  if (it == vars.end() || it->second.empty()) { return std::nullopt; }
  return it->second;
}

std::vector<std::filesystem::path> library_dirs(std::filesystem::path const &prefix) {
  std::string const multiarch{ std::string{ platform::arch_name() } + "-linux-gnu" };
  return { prefix / "lib", prefix / "lib64", prefix / "lib" / multiarch };
}

std::optional<std::filesystem::path> find_library(std::filesystem::path const &prefix,
                                                  std::string const &library) {
  for (auto const &dir : library_dirs(prefix)) {
    for (char const *ext : { ".so", ".a", ".dylib" }) {
      if (platform::file_exists(dir / ("lib" + library + ext))) { return dir; }
    }
  }
  return std::nullopt;
}

std::optional<external_dep_location> locate_pkg_config(std::string const &name,
                                                      std::atomic_bool const *cancel) {
  auto const module{ util_to_lower(name) };
  if (!external_deps_pkg_config({ "--exists", module }, cancel)) { return std::nullopt; }

  auto const prefix{ external_deps_pkg_config({ "--variable=prefix", module }, cancel) };
  auto const cflags{ external_deps_pkg_config({ "--cflags-only-I", module }, cancel) };
  auto const libs{ external_deps_pkg_config({ "--libs-only-L", module }, cancel) };

  external_dep_location loc;
  loc.prefix = std::string{ util_trim(prefix.value_or("")) };
  auto const incdirs{ external_deps_flag_values(cflags.value_or(""), "-I") };
  auto const libdirs{ external_deps_flag_values(libs.value_or(""), "-L") };
  loc.incdir = incdirs.empty() ? loc.prefix / "include" : std::filesystem::path{ incdirs.front() };
  loc.libdir = libdirs.empty() ? loc.prefix / "lib" : std::filesystem::path{ libdirs.front() };
  return loc;
}

std::optional<external_dep_location> locate_variables(std::string const &name,
                                                     variable_map const &vars) {
  auto const key{ var_prefix(name) };
  auto const dir{ lookup(vars, key + "_DIR") };
  auto const incdir{ lookup(vars, key + "_INCDIR") };
  auto const libdir{ lookup(vars, key + "_LIBDIR") };
  if (!dir && !incdir && !libdir) { return std::nullopt; }

  std::filesystem::path const prefix{ dir.value_or("") };
  return external_dep_location{
    .prefix = prefix,
    .incdir = incdir ? std::filesystem::path{ *incdir } : prefix / "include",
    .libdir = libdir ? std::filesystem::path{ *libdir } : prefix / "lib",
  };
}

std::optional<external_dep_location> locate_prefixes(external_dependency const &dep,
                                                    variable_map const &vars) {
  std::vector<std::filesystem::path> prefixes;
  if (auto const extra{ lookup(vars, "EXTERNAL_DEPS_DIRS") }) {
    std::stringstream ss{ *extra };
    for (std::string item; std::getline(ss, item, ':');) {
      if (!item.empty()) { prefixes.emplace_back(item); }
    }
  }
  for (char const *p : { "/usr", "/usr/local", "/opt/homebrew" }) {
    prefixes.emplace_back(p);
  }

  auto const header{ dep.header || dep.library ? dep.header
                                               : std::optional{ dep.name + ".h" } };
  for (auto const &prefix : prefixes) {
    bool const has_header{ header && platform::file_exists(prefix / "include" / *header) };
    auto const libdir{ dep.library ? find_library(prefix, *dep.library) : std::nullopt };
    if (!has_header && !libdir) { continue; }
    return external_dep_location{ .prefix = prefix,
                                  .incdir = prefix / "include",
                                  .libdir = libdir.value_or(prefix / "lib") };
  }
  return std::nullopt;
}

}  // namespace

std::optional<std::string> external_deps_pkg_config(std::vector<std::string> const &args,
                                                    std::atomic_bool const *cancel) {
  if (!platform::find_executable("pkg-config")) { return std::nullopt; }

  std::vector<std::string> argv{ "pkg-config" };
  argv.insert(argv.end(), args.begin(), args.end());

  std::string out;
  shell_run_cfg const cfg{ .on_stdout_line =
                               [&](std::string_view line) {
                                 out += line;
                                 out += '\n';
                               },
                           .cancel = cancel };
  auto const result{ shell_exec(argv, cfg) };
  if (result.cancelled) { throw cancelled(); }
  if (result.exit_code != 0) { return std::nullopt; }
  return out;
}

std::vector<std::string> external_deps_flag_values(std::string const &flags,
                                                   std::string const &prefix) {
  std::vector<std::string> out;
  std::stringstream ss{ flags };
  for (std::string token; ss >> token;) {
    if (token.starts_with(prefix) && token.size() > prefix.size()) {
      out.push_back(token.substr(prefix.size()));
    }
  }
  return out;
}

external_dep_location external_deps_locate(external_dependency const &dep,
                                          variable_map const &vars,
                                          std::atomic_bool const *cancel) {
  if (auto loc{ locate_pkg_config(dep.name, cancel) }) {
    tui::debug("external dependency %s: pkg-config (%s)",
               dep.name.c_str(),
               loc->prefix.c_str());
    return *loc;
  }
  if (auto loc{ locate_variables(dep.name, vars) }) {
    tui::debug("external dependency %s: variables", dep.name.c_str());
    return *loc;
  }
  if (auto loc{ locate_prefixes(dep, vars) }) {
    tui::debug("external dependency %s: found under %s",
               dep.name.c_str(),
               loc->prefix.c_str());
    return *loc;
  }
  throw external_dependency_not_found(dep.name);
}

variable_map external_deps_resolve(std::map<std::string, external_dependency> const &deps,
                                   variable_map const &vars,
                                   std::atomic_bool const *cancel) {
  variable_map out;
  for (auto const &[name, dep] : deps) {
    auto const loc{ external_deps_locate(dep, vars, cancel) };
    auto const key{ var_prefix(name) };
    out[key + "_DIR"] = loc.prefix.string();
    out[key + "_INCDIR"] = loc.incdir.string();
    out[key + "_LIBDIR"] = loc.libdir.string();
  }
  return out;
}

}  // namespace quarry
