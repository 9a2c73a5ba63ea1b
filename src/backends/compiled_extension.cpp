#include "backends/build_backend.h"
#include "backends/external_deps.h"
#include "backends/lua_headers.h"

#include "errors.h"
#include "tui.h"
#include "util.h"

#include <algorithm>

namespace quarry {

namespace {

std::string var(variable_map const &vars, std::string const &key) {
  auto const it{ vars.find(key) };
  return it == vars.end() ? std::string{} : it->second;
}

std::string expand(variable_map const &vars, std::string const &text) {
  return util_substitute_vars(text, [&](std::string const &k) { return var(vars, k); });
}

std::filesystem::path source_relative(build_context const &ctx, std::string const &dir) {
  std::filesystem::path const p{ dir };
  return p.is_absolute() ? p : ctx.source_dir / p;
}

}  // namespace

namespace backend_detail {

void compile_native(native_module const &m,
                    build_context const &ctx,
                    variable_map const &vars,
                    std::vector<std::filesystem::path> const &incdirs,
                    std::filesystem::path const &output) {
  auto const obj_dir{ ctx.scratch_dir / "obj" / m.module };
  std::filesystem::create_directories(obj_dir);
  std::filesystem::create_directories(output.parent_path());

  auto const cc{ split_words(var(vars, "CC")) };
  auto const ld{ split_words(var(vars, "LD")) };
  if (cc.empty() || ld.empty()) { throw tool_not_found("CC/LD (empty)"); }

  std::vector<std::string> objects;
  for (auto const &rel : m.sources) {
    auto const src{ require_source_file(ctx, expand(vars, rel)) };
    auto const obj{ obj_dir / (std::filesystem::path{ rel }.stem().string() + "-" +
                               std::to_string(objects.size()) + ".o") };

    auto argv{ cc };
    for (auto &f : split_words(var(vars, "CFLAGS"))) { argv.push_back(f); }
    for (auto const &inc : incdirs) { argv.push_back("-I" + inc.string()); }
    for (auto const &inc : m.incdirs) {
      argv.push_back("-I" + source_relative(ctx, expand(vars, inc)).string());
    }
    for (auto const &def : m.defines) { argv.push_back("-D" + expand(vars, def)); }
    argv.insert(argv.end(), { "-c", src.string(), "-o", obj.string() });

    auto const r{ run_tool(argv, ctx.source_dir, std::nullopt, ctx.cancel) };
    if (r.exit_code != 0) { throw compile_error(r.output); }
    objects.push_back(obj.string());
  }

  auto argv{ ld };
  for (auto &f : split_words(var(vars, "LIBFLAG"))) { argv.push_back(f); }
  argv.insert(argv.end(), { "-o", output.string() });
  argv.insert(argv.end(), objects.begin(), objects.end());
  for (auto const &dir : m.libdirs) {
    argv.push_back("-L" + source_relative(ctx, expand(vars, dir)).string());
  }
  for (auto const &lib : m.libraries) { argv.push_back("-l" + expand(vars, lib)); }

  auto const r{ run_tool(argv, ctx.source_dir, std::nullopt, ctx.cancel) };
  if (r.exit_code != 0) { throw compile_error(r.output); }
}

std::string lib_extension(variable_map const &vars) {
  auto const ext{ var(vars, "LIB_EXTENSION") };
  return ext.empty() ? std::string{ "so" } : ext;
}

}  // namespace backend_detail

installed_files backend_compiled_extension(compiled_extension_spec const &spec,
                                           package_descriptor const &d,
                                           build_context const &ctx) {
  auto const headers{ lua_headers_find(ctx.runtime,
                                       ctx.variables,
                                       ctx.header_cache,
                                       ctx.cancel) };
  tui::debug("%s: Lua headers from %s (%s)",
             d.name.c_str(),
             headers.origin.c_str(),
             headers.incdir.c_str());

  auto vars{ context_merge_variables(
      ctx.variables,
      external_deps_resolve(d.external_dependencies, ctx.variables, ctx.cancel)) };
  vars["LUA_INCDIR"] = headers.incdir.string();

  installed_files out;
  for (auto const &m : spec.native_modules) {
    std::string module_path{ m.module };
    std::ranges::replace(module_path, '.', '/');
    std::filesystem::path const rel{ module_path + "." + backend_detail::lib_extension(vars) };
    auto const built{ ctx.scratch_dir / "lib" / rel };
    backend_detail::compile_native(m, ctx, vars, { headers.incdir }, built);
    out.push_back({ ctx.paths.lib_dir / rel, built });
  }

  backend_detail::append_lua_modules(out, spec.lua_modules, ctx);
  backend_detail::append_install_spec(out, d, ctx);
  return out;
}

}  // namespace quarry
