#include "backends/build_backend.h"

#include "tui.h"

#include <algorithm>
#include <filesystem>
#include <string>

namespace quarry {

namespace {

// luarocks' module discovery when a rockspec lists none: every .lua file below src/,
// lua/ and lib/, except test files and spec directories.
std::vector<lua_module> autodetect_modules(std::filesystem::path const &source_dir) {
  std::vector<lua_module> out;
  for (char const *root : { "src", "lua", "lib" }) {
    auto const dir{ source_dir / root };
    if (!std::filesystem::is_directory(dir)) { continue; }

    for (auto it{ std::filesystem::recursive_directory_iterator{ dir } };
         it != std::filesystem::recursive_directory_iterator{};
         ++it) {
      auto const name{ it->path().filename().string() };
      if (it->is_directory() && (name == "spec" || name == ".luarocks" ||
                                 name == "lua_modules")) {
        it.disable_recursion_pending();
        continue;
      }
      if (!it->is_regular_file() || it->path().extension() != ".lua") { continue; }
      if (name == "test.lua" || name == "tests.lua") { continue; }

      auto const rel{ std::filesystem::relative(it->path(), dir) };
      std::string module{ rel.parent_path().generic_string() };
      std::ranges::replace(module, '/', '.');
      if (name != "init.lua") {
        module += module.empty() ? rel.stem().string() : "." + rel.stem().string();
      }
      if (module.empty()) { continue; }
      out.push_back({ .module = module,
                      .path = std::filesystem::relative(it->path(), source_dir)
                                  .generic_string() });
    }
  }

  std::ranges::sort(out, [](auto const &a, auto const &b) { return a.module < b.module; });
  auto const dup{ std::ranges::unique(out, {}, &lua_module::module) };
  out.erase(dup.begin(), dup.end());
  return out;
}

}  // namespace

installed_files backend_builtin(builtin_spec const &spec,
                                package_descriptor const &d,
                                build_context const &ctx) {
  installed_files out;
  if (spec.autodetect) {
    auto const modules{ autodetect_modules(ctx.source_dir) };
    tui::debug("%s: autodetected %zu Lua modules", d.name.c_str(), modules.size());
    backend_detail::append_lua_modules(out, modules, ctx);
  } else {
    backend_detail::append_lua_modules(out, spec.modules, ctx);
  }
  backend_detail::append_install_spec(out, d, ctx);
  return out;
}

}  // namespace quarry
