#include "backends/build_backend.h"

#include "errors.h"
#include "platform.h"
#include "sol_util.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace quarry {

namespace {

constexpr long long kDefaultTimeoutMs{ 60000 };

bool within(std::filesystem::path const &root, std::filesystem::path const &p) {
  auto const rel{ p.lexically_relative(root) };
  return !rel.empty() && *rel.begin() != "..";
}

// Filesystem view a script gets: reads from the source tree, writes to the output
// directory, nothing else. Roots and resolved paths are canonical, so a symlink that
// points out of the sandbox is caught like a ".." path.
struct script_fs {
  std::filesystem::path source_dir;
  std::filesystem::path out_dir;

  bool inside(std::filesystem::path const &p) const {
    return p == source_dir || p == out_dir || within(source_dir, p) || within(out_dir, p);
  }

  std::filesystem::path resolve(std::filesystem::path const &base,
                                std::string const &raw) const {
    std::filesystem::path const p{ raw };
    auto const full{ std::filesystem::weakly_canonical(p.is_absolute() ? p : base / p) };
    if (!inside(full)) {
      throw std::runtime_error("path escapes the build sandbox: " + raw);
    }
    return full;
  }

  // Links below a directory are not followed by resolve(); check each one's target.
  void check_tree(std::filesystem::path const &dir) const {
    if (!std::filesystem::is_directory(dir)) { return; }
    for (auto const &e : std::filesystem::recursive_directory_iterator{ dir }) {
      if (e.is_symlink() && !inside(std::filesystem::weakly_canonical(e.path()))) {
        throw std::runtime_error("symlink escapes the build sandbox: " + e.path().string());
      }
    }
  }

  std::filesystem::path input(std::string const &raw) const {
    return resolve(source_dir, raw);
  }

  std::filesystem::path output(std::string const &raw) const {
    auto const p{ resolve(out_dir, raw) };
    if (!within(out_dir, p)) { throw std::runtime_error("not an output path: " + raw); }
    return p;
  }
};

sol::table make_ctx_table(sol::state &lua,
                          script_fs const &fs,
                          build_context const &ctx,
                          installed_files &recorded) {
  sol::table t{ lua.create_table() };
  t["source_dir"] = fs.source_dir.string();
  t["out_dir"] = fs.out_dir.string();
  t["runtime"] = ctx.runtime;

  sol::table vars{ lua.create_table() };
  for (auto const &[k, v] : ctx.variables) { vars[k] = v; }
  t["variables"] = vars;

  t.set_function("read", [fs](std::string const &p) { return util_load_file_text(fs.input(p)); });
  t.set_function("write", [fs](std::string const &p, std::string const &text) {
    util_write_file_atomic(fs.output(p), text);
  });
  t.set_function("copy", [fs](std::string const &src, std::string const &dst) {
    auto const from{ fs.input(src) };
    fs.check_tree(from);
    auto const to{ fs.output(dst) };
    std::filesystem::create_directories(to.parent_path());
    std::filesystem::copy(from,
                          to,
                          std::filesystem::copy_options::recursive |
                              std::filesystem::copy_options::overwrite_existing);
  });
  t.set_function("mkdir", [fs](std::string const &p) {
    std::filesystem::create_directories(fs.output(p));
  });
  t.set_function("exists", [fs](std::string const &p) {
    return std::filesystem::exists(fs.input(p));
  });
  t.set_function("list", [fs](std::string const &p, sol::this_state s) {
    std::vector<std::string> names;
    for (auto const &e : std::filesystem::directory_iterator{ fs.input(p) }) {
      names.push_back(e.path().filename().string());
    }
    std::ranges::sort(names);
    sol::state_view view{ s };
    return view.create_table_with_sequence(names);
  });
  t.set_function("install_lua", [fs, &ctx, &recorded](std::string const &module,
                                                        std::string const &p) {
    auto const src{ fs.input(p) };
    if (!platform::file_exists(src)) { throw std::runtime_error("no such file: " + p); }
    recorded.push_back(
        { ctx.paths.lua_dir / backend_detail::lua_module_destination(module, src), src });
  });
  return t;
}

long long timeout_ms(variable_map const &vars) {
  auto const it{ vars.find("SCRIPT_TIMEOUT_MS") };
  if (it == vars.end() || it->second.empty()) { return kDefaultTimeoutMs; }
  try {
    return std::stoll(it->second);
  } catch (std::exception const &) {
    throw script_error("SCRIPT_TIMEOUT_MS is not a number: " + it->second);
  }
}

}  // namespace

installed_files backend_user_script(user_script_spec const &spec,
                                    package_descriptor const &d,
                                    build_context const &ctx) {
  std::string code;
  std::string chunk_name{ d.name + " build" };
  if (spec.script) {
    code = util_load_file_text(backend_detail::require_source_file(ctx, *spec.script));
    chunk_name = *spec.script;
  } else if (spec.inline_code) {
    code = *spec.inline_code;
  } else {
    throw script_error("neither build.script nor build.inline is set");
  }

  std::filesystem::create_directories(ctx.scratch_dir / "out");
  script_fs const fs{ .source_dir = std::filesystem::canonical(ctx.source_dir),
                      .out_dir = std::filesystem::canonical(ctx.scratch_dir / "out") };

  installed_files out;
  auto lua{ sol_util_make_sandboxed_state() };
  sol::table const ctx_table{ make_ctx_table(*lua, fs, ctx, out) };
  (*lua)["ctx"] = ctx_table;

  auto const limit{ timeout_ms(ctx.variables) };
  sol_util_script_guard const guard{ *lua, std::chrono::milliseconds{ limit }, ctx.cancel };

  try {
    sol_util_run_script(*lua, code, chunk_name);

    sol::object const build_fn{ (*lua)["build"] };
    if (build_fn.get_type() == sol::type::function) {
      sol::protected_function fn{ build_fn };
      auto const result{ fn(ctx_table) };
      if (!result.valid()) {
        sol::error err = result;
        throw std::runtime_error(err.what());
      }
    }
  } catch (std::runtime_error const &e) {
    if (guard.was_cancelled()) { throw cancelled(); }
    if (guard.timed_out()) { throw script_timeout(limit); }
    throw script_error(e.what());
  }

  backend_detail::append_directory(out, fs.out_dir, {});
  backend_detail::append_install_spec(out, d, ctx);
  return out;
}

}  // namespace quarry
