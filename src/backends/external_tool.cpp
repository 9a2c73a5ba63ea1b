#include "backends/build_backend.h"
#include "backends/external_deps.h"
#include "backends/lua_headers.h"

#include "errors.h"
#include "tui.h"
#include "util.h"

#include <map>

namespace quarry {

namespace {

constexpr char const *kCmakeBuildDir{ "build.quarry" };

std::string var(variable_map const &vars, std::string const &key) {
  auto const it{ vars.find(key) };
  return it == vars.end() ? std::string{} : it->second;
}

// The variables every tool sees: PREFIX and its layout, the toolchain, Lua locations
// and any external dependency locations.
variable_map injected_variables(package_descriptor const &d,
                                build_context const &ctx,
                                std::filesystem::path const &prefix) {
  auto vars{ context_merge_variables(
      ctx.variables,
      external_deps_resolve(d.external_dependencies, ctx.variables, ctx.cancel)) };

  if (var(vars, "LUA_INCDIR").empty()) {
    try {
      vars["LUA_INCDIR"] =
          lua_headers_find(ctx.runtime, ctx.variables, ctx.header_cache, ctx.cancel)
              .incdir.string();
    } catch (header_not_found const &e) {
      tui::debug("%s: LUA_INCDIR left empty: %s", d.name.c_str(), e.what());
    }
  }

  vars["PREFIX"] = prefix.string();
  vars["LUADIR"] = (prefix / ctx.paths.lua_dir).string();
  vars["LIBDIR"] = (prefix / ctx.paths.lib_dir).string();
  vars["BINDIR"] = (prefix / ctx.paths.bin_dir).string();
  vars["CONFDIR"] = (prefix / ctx.paths.conf_dir).string();
  if (var(vars, "LUA").empty()) { vars["LUA"] = "lua" + ctx.runtime; }
  for (char const *key : { "LUA_LIBDIR", "LUA_BINDIR" }) { vars.try_emplace(key, ""); }
  return vars;
}

variable_map substituted(std::map<std::string, std::string> const &raw,
                         variable_map const &vars) {
  variable_map out;
  for (auto const &[k, v] : raw) {
    out[k] = util_substitute_vars(v,
                                  [&](std::string const &name) { return var(vars, name); });
  }
  return out;
}

void check(backend_detail::tool_output const &r, std::string const &tool) {
  if (r.exit_code != 0) { throw tool_exit_nonzero(tool, r.exit_code, r.output); }
}

void run_make(external_tool_spec const &spec,
              build_context const &ctx,
              variable_map const &vars) {
  auto const make{ backend_detail::split_words(var(vars, "MAKE")) };
  if (make.empty()) { throw tool_not_found("MAKE (empty)"); }

  auto const pass{ [&](std::string const &target,
                       std::map<std::string, std::string> const &extra) {
    auto argv{ make };
    argv.insert(argv.end(), { "-f", spec.makefile });
    if (!target.empty()) { argv.push_back(target); }

    auto assignments{ vars };
    for (auto const &[k, v] : substituted(spec.variables, vars)) { assignments[k] = v; }
    for (auto const &[k, v] : substituted(extra, vars)) { assignments[k] = v; }
    for (auto const &[k, v] : assignments) { argv.push_back(k + "=" + v); }

    check(backend_detail::run_tool(argv, ctx.source_dir, std::nullopt, ctx.cancel),
          make.front());
  } };

  if (spec.build_pass) { pass(spec.build_target, spec.build_variables); }
  if (spec.install_pass) { pass(spec.install_target, spec.install_variables); }
}

void run_cmake(external_tool_spec const &spec,
               build_context const &ctx,
               variable_map const &vars) {
  auto const cmake{ backend_detail::split_words(var(vars, "CMAKE")) };
  if (cmake.empty()) { throw tool_not_found("CMAKE (empty)"); }

  if (spec.cmake_lists_content) {
    util_write_file_atomic(ctx.source_dir / "CMakeLists.txt", *spec.cmake_lists_content);
  }

  auto configure{ cmake };
  configure.insert(configure.end(),
                   { "-H.",
                     std::string{ "-B" } + kCmakeBuildDir,
                     "-DCMAKE_INSTALL_PREFIX=" + var(vars, "PREFIX"),
                     "-DCMAKE_BUILD_TYPE=Release" });
  for (auto const &[k, v] : substituted(spec.variables, vars)) {
    configure.push_back("-D" + k + "=" + v);
  }
  check(backend_detail::run_tool(configure, ctx.source_dir, std::nullopt, ctx.cancel),
        cmake.front());

  if (spec.build_pass) {
    auto argv{ cmake };
    argv.insert(argv.end(), { "--build", kCmakeBuildDir, "--config", "Release" });
    check(backend_detail::run_tool(argv, ctx.source_dir, std::nullopt, ctx.cancel),
          cmake.front());
  }
  if (spec.install_pass) {
    auto argv{ cmake };
    argv.insert(argv.end(),
                { "--build", kCmakeBuildDir, "--target", "install", "--config", "Release" });
    check(backend_detail::run_tool(argv, ctx.source_dir, std::nullopt, ctx.cancel),
          cmake.front());
  }
}

void run_command(external_tool_spec const &spec,
                 build_context const &ctx,
                 variable_map const &vars) {
  auto env{ shell_getenv() };
  for (auto const &[k, v] : vars) { env[k] = v; }
  for (auto const &[k, v] : substituted(spec.variables, vars)) { env[k] = v; }

  for (auto const *cmd : { &spec.build_command, &spec.install_command }) {
    if (!*cmd) { continue; }
    check(backend_detail::run_shell(**cmd, ctx.source_dir, env, ctx.cancel), "command");
  }
}

// Maps the tool's install prefix onto the package layout.
void collect_prefix(installed_files &out,
                    std::filesystem::path const &prefix,
                    tree_paths const &paths) {
  if (!std::filesystem::is_directory(prefix)) { return; }

  std::map<std::string, std::filesystem::path> const layout{
    { "lua", paths.lua_dir },   { "lib", paths.lib_dir }, { "bin", paths.bin_dir },
    { "conf", paths.conf_dir }, { "doc", paths.doc_dir },
  };

  for (auto const &entry : std::filesystem::directory_iterator{ prefix }) {
    auto const name{ entry.path().filename().string() };
    if (entry.is_directory()) {
      auto const it{ layout.find(name) };
      backend_detail::append_directory(out,
                                       entry.path(),
                                       it == layout.end() ? std::filesystem::path{ name }
                                                          : it->second);
    } else if (entry.is_regular_file()) {
      out.push_back({ name, entry.path() });
    }
  }
}

}  // namespace

installed_files backend_external_tool(external_tool_spec const &spec,
                                      package_descriptor const &d,
                                      build_context const &ctx) {
  auto const prefix{ ctx.scratch_dir / "prefix" };
  std::filesystem::create_directories(prefix);
  auto const vars{ injected_variables(d, ctx, prefix) };

  switch (spec.tool) {
    case external_tool_kind::make: run_make(spec, ctx, vars); break;
    case external_tool_kind::cmake: run_cmake(spec, ctx, vars); break;
    case external_tool_kind::command: run_command(spec, ctx, vars); break;
  }

  installed_files out;
  collect_prefix(out, prefix, ctx.paths);
  backend_detail::append_install_spec(out, d, ctx);
  return out;
}

}  // namespace quarry
