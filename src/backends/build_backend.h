#pragma once

#include "context.h"
#include "rockspec.h"
#include "shell.h"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace quarry {

class cache;

// Destination directories inside a package prefix.
struct tree_paths {
  std::filesystem::path lua_dir{ "lua" };
  std::filesystem::path lib_dir{ "lib" };
  std::filesystem::path bin_dir{ "bin" };
  std::filesystem::path conf_dir{ "conf" };
  std::filesystem::path doc_dir{ "doc" };
};

struct build_context {
  std::filesystem::path source_dir;   // unpacked source, read-only to backends
  std::filesystem::path scratch_dir;  // backend-private output area
  std::string runtime;
  tree_paths paths;
  variable_map variables;
  std::atomic_bool const *cancel{ nullptr };
  cache *header_cache{ nullptr };  // downloaded Lua headers; optional
};

// One file of a package prefix: copied from a path, or written from bytes.
struct installed_file {
  std::filesystem::path relative;
  std::variant<std::filesystem::path, std::string> content;
};

using installed_files = std::vector<installed_file>;

// Dispatches on d.build. Throws a build_error subclass on failure.
installed_files build_backend_run(package_descriptor const &d, build_context const &ctx);

// Materializes `files` under `prefix`, creating directories and keeping the executable
// bit of copied files.
void installed_files_write(installed_files const &files, std::filesystem::path const &prefix);

// Individual backends.
installed_files backend_builtin(builtin_spec const &spec,
                                package_descriptor const &d,
                                build_context const &ctx);
installed_files backend_compiled_extension(compiled_extension_spec const &spec,
                                           package_descriptor const &d,
                                           build_context const &ctx);
installed_files backend_external_tool(external_tool_spec const &spec,
                                      package_descriptor const &d,
                                      build_context const &ctx);
installed_files backend_user_script(user_script_spec const &spec,
                                    package_descriptor const &d,
                                    build_context const &ctx);
installed_files backend_treesitter_parser(treesitter_parser_spec const &spec,
                                          package_descriptor const &d,
                                          build_context const &ctx);

// Shared by the builtin-style backends.
namespace backend_detail {

// "a.b" -> "a/b.lua", or "a/b/init.lua" when the source file is init.lua.
std::filesystem::path lua_module_destination(std::string const &module,
                                             std::filesystem::path const &source);

// Source-relative path that must exist and stay inside the source tree.
std::filesystem::path require_source_file(build_context const &ctx, std::string const &rel);

void append_lua_modules(installed_files &out,
                        std::vector<lua_module> const &modules,
                        build_context const &ctx);

// build.install and copy_directories.
void append_install_spec(installed_files &out,
                         package_descriptor const &d,
                         build_context const &ctx);

// Every regular file below `dir`, relative to it.
void append_directory(installed_files &out,
                      std::filesystem::path const &dir,
                      std::filesystem::path const &dest_prefix);

struct tool_output {
  int exit_code;
  std::string output;  // stdout and stderr interleaved, truncated
};

inline constexpr std::size_t kMaxToolOutput{ 4096 };

// Runs argv in `cwd`. Throws tool_not_found when argv[0] is not on PATH and cancelled
// when the run was cancelled.
tool_output run_tool(std::vector<std::string> const &argv,
                     std::filesystem::path const &cwd,
                     std::optional<shell_env_t> env,
                     std::atomic_bool const *cancel);

// Same contract for a /bin/sh script.
tool_output run_shell(std::string const &script,
                      std::filesystem::path const &cwd,
                      std::optional<shell_env_t> env,
                      std::atomic_bool const *cancel);

// Whitespace-separated words, for CC/CFLAGS-style variables.
std::vector<std::string> split_words(std::string_view text);

// Compiles m.sources with CC/CFLAGS and links them into `output` with LD/LIBFLAG.
// `incdirs` come before the module's own. Throws compile_error or tool_not_found.
void compile_native(native_module const &m,
                    build_context const &ctx,
                    variable_map const &vars,
                    std::vector<std::filesystem::path> const &incdirs,
                    std::filesystem::path const &output);

// LIB_EXTENSION, "so" when unset.
std::string lib_extension(variable_map const &vars);

}  // namespace backend_detail

}  // namespace quarry
