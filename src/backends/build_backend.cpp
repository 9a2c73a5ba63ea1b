#include "backends/build_backend.h"

#include "errors.h"
#include "platform.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <system_error>

namespace quarry {

installed_files build_backend_run(package_descriptor const &d, build_context const &ctx) {
  tui::debug("%s %s: %s build",
             d.name.c_str(),
             d.version.text().c_str(),
             std::string{ build_spec_tag(d.build) }.c_str());

  return std::visit(
      match{
          [&](builtin_spec const &s) { return backend_builtin(s, d, ctx); },
          [&](compiled_extension_spec const &s) {
            return backend_compiled_extension(s, d, ctx);
          },
          [&](external_tool_spec const &s) { return backend_external_tool(s, d, ctx); },
          [&](user_script_spec const &s) { return backend_user_script(s, d, ctx); },
          [&](treesitter_parser_spec const &s) {
            return backend_treesitter_parser(s, d, ctx);
          },
          [](unsupported_build_spec const &s) -> installed_files {
            throw unsupported_build_type(s.tag);
          },
      },
      d.build);
}

void installed_files_write(installed_files const &files,
                           std::filesystem::path const &prefix) {
  for (auto const &f : files) {
    auto const rel{ f.relative.lexically_normal() };
    if (rel.empty() || rel.is_absolute() || *rel.begin() == "..") {
      throw std::logic_error("installed file escapes the prefix: " + f.relative.string());
    }

    auto const dest{ prefix / rel };
    std::filesystem::create_directories(dest.parent_path());
    std::visit(match{
                   [&](std::filesystem::path const &from) {
                     std::filesystem::copy_file(
                         from,
                         dest,
                         std::filesystem::copy_options::overwrite_existing);
                   },
                   [&](std::string const &bytes) { util_write_file_atomic(dest, bytes); },
               },
               f.content);
  }
}

namespace backend_detail {

std::filesystem::path lua_module_destination(std::string const &module,
                                             std::filesystem::path const &source) {
  std::string rel{ module };
  std::ranges::replace(rel, '.', '/');
  if (source.filename() == "init.lua" && !module.ends_with(".init")) {
    return std::filesystem::path{ rel } / "init.lua";
  }
  return std::filesystem::path{ rel + ".lua" };
}

std::filesystem::path require_source_file(build_context const &ctx, std::string const &rel) {
  std::filesystem::path const p{ rel };
  auto const normal{ p.lexically_normal() };
  if (p.is_absolute() || (!normal.empty() && *normal.begin() == "..")) {
    throw missing_file(rel + " (outside the source tree)");
  }

  auto const full{ ctx.source_dir / normal };
  if (!std::filesystem::exists(full)) { throw missing_file(rel); }
  return full;
}

void append_lua_modules(installed_files &out,
                        std::vector<lua_module> const &modules,
                        build_context const &ctx) {
  for (auto const &m : modules) {
    auto const src{ require_source_file(ctx, m.path) };
    out.push_back({ ctx.paths.lua_dir / lua_module_destination(m.module, src), src });
  }
}

void append_directory(installed_files &out,
                      std::filesystem::path const &dir,
                      std::filesystem::path const &dest_prefix) {
  for (auto const &entry : std::filesystem::recursive_directory_iterator{ dir }) {
    if (!entry.is_regular_file()) { continue; }
    out.push_back({ dest_prefix / std::filesystem::relative(entry.path(), dir),
                    entry.path() });
  }
}

void append_install_spec(installed_files &out,
                         package_descriptor const &d,
                         build_context const &ctx) {
  for (auto const &[module, rel] : d.install.lua) {
    auto const src{ require_source_file(ctx, rel) };
    out.push_back({ ctx.paths.lua_dir / lua_module_destination(module, src), src });
  }

  for (auto const &[module, rel] : d.install.lib) {
    auto const src{ require_source_file(ctx, rel) };
    std::string dest{ module };
    std::ranges::replace(dest, '.', '/');
    out.push_back({ ctx.paths.lib_dir / (dest + src.extension().string()), src });
  }

  for (auto const &[name, rel] : d.install.bin) {
    out.push_back({ ctx.paths.bin_dir / name, require_source_file(ctx, rel) });
  }

  for (auto const &[name, rel] : d.install.conf) {
    out.push_back({ ctx.paths.conf_dir / name, require_source_file(ctx, rel) });
  }

  for (auto const &dir : d.copy_directories) {
    auto const src{ require_source_file(ctx, dir) };
    if (!std::filesystem::is_directory(src)) { throw missing_file(dir + "/"); }
    auto const dest{ dir == "doc" || dir == "docs" ? ctx.paths.doc_dir
                                                   : std::filesystem::path{ dir } };
    append_directory(out, src, dest);
  }
}

namespace {

shell_run_cfg capture_cfg(std::string &output,
                          std::filesystem::path const &cwd,
                          std::optional<shell_env_t> env,
                          std::atomic_bool const *cancel) {
  auto on_line{ [&output](std::string_view line) {
    tui::debug("  %.*s", static_cast<int>(line.size()), line.data());
    if (output.size() < kMaxToolOutput) {
      output.append(line.substr(0, kMaxToolOutput - output.size()));
      output += '\n';
    }
  } };
  return shell_run_cfg{ .on_output_line = std::move(on_line),
                        .cwd = cwd,
                        .env = std::move(env),
                        .cancel = cancel };
}

tool_output finish(shell_result const &r, std::string output) {
  if (r.cancelled) { throw cancelled(); }
  int const code{ r.signal ? 128 + *r.signal : r.exit_code };
  return tool_output{ .exit_code = code, .output = std::move(output) };
}

}  // namespace

tool_output run_tool(std::vector<std::string> const &argv,
                     std::filesystem::path const &cwd,
                     std::optional<shell_env_t> env,
                     std::atomic_bool const *cancel) {
  if (argv.empty()) { throw std::logic_error("run_tool: empty argv"); }
  if (!platform::find_executable(argv.front())) { throw tool_not_found(argv.front()); }

  std::string cmdline;
  for (auto const &a : argv) { cmdline += (cmdline.empty() ? "" : " ") + shell_quote(a); }
  tui::debug("run: %s", cmdline.c_str());

  std::string output;
  auto const result{ shell_exec(argv, capture_cfg(output, cwd, std::move(env), cancel)) };
  return finish(result, std::move(output));
}

tool_output run_shell(std::string const &script,
                      std::filesystem::path const &cwd,
                      std::optional<shell_env_t> env,
                      std::atomic_bool const *cancel) {
  tui::debug("run script: %s", script.c_str());
  std::string output;
  auto const result{ shell_run(script, capture_cfg(output, cwd, std::move(env), cancel)) };
  return finish(result, std::move(output));
}

std::vector<std::string> split_words(std::string_view text) {
  std::vector<std::string> out;
  std::size_t i{ 0 };
  while (i < text.size()) {
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) { ++i; }
    auto const start{ i };
    while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) { ++i; }
    if (i > start) { out.emplace_back(text.substr(start, i - start)); }
  }
  return out;
}

}  // namespace backend_detail

}  // namespace quarry
