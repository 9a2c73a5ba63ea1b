#pragma once

#include "constraint.h"
#include "version.h"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace quarry {

// Module "a.b" implemented by a Lua file.
struct lua_module {
  std::string module;
  std::string path;
};

// Module "a.b" compiled from C sources into lib/a/b.<ext>.
struct native_module {
  std::string module;
  std::vector<std::string> sources;
  std::vector<std::string> incdirs;
  std::vector<std::string> libdirs;
  std::vector<std::string> libraries;
  std::vector<std::string> defines;
};

// build.install: destination key -> source path, per category.
struct install_spec {
  std::map<std::string, std::string> lua;
  std::map<std::string, std::string> lib;
  std::map<std::string, std::string> bin;
  std::map<std::string, std::string> conf;

  bool empty() const { return lua.empty() && lib.empty() && bin.empty() && conf.empty(); }
};

struct builtin_spec {
  std::vector<lua_module> modules;
  bool autodetect{ false };  // no modules table: discover src/ or lua/ .lua files
};

struct compiled_extension_spec {
  std::vector<lua_module> lua_modules;
  std::vector<native_module> native_modules;
};

enum class external_tool_kind { make, cmake, command };

struct external_tool_spec {
  external_tool_kind tool{ external_tool_kind::make };

  // make
  std::string makefile{ "Makefile" };
  std::string build_target;
  bool build_pass{ true };
  std::string install_target{ "install" };
  bool install_pass{ true };
  std::map<std::string, std::string> build_variables;
  std::map<std::string, std::string> install_variables;

  // cmake (and make's extra variables)
  std::map<std::string, std::string> variables;
  std::optional<std::string> cmake_lists_content;

  // command
  std::optional<std::string> build_command;
  std::optional<std::string> install_command;
};

struct user_script_spec {
  std::optional<std::string> script;       // file inside the source tree
  std::optional<std::string> inline_code;  // Lua source text
};

// Compiles <location>/src/parser.c (and scanner.c when present) into parser/<lang>.<ext>,
// optionally running `tree-sitter generate` first. Queries go to queries/.
struct treesitter_parser_spec {
  std::string lang;
  bool parser{ true };
  bool generate{ false };
  std::optional<std::string> location;  // grammar directory inside the source tree
  std::map<std::string, std::string> queries;
};

struct unsupported_build_spec {
  std::string tag;
};

using build_spec = std::variant<builtin_spec,
                                compiled_extension_spec,
                                external_tool_spec,
                                user_script_spec,
                                treesitter_parser_spec,
                                unsupported_build_spec>;

std::string_view build_spec_tag(build_spec const &spec);

struct external_dependency {
  std::string name;
  std::optional<std::string> header;
  std::optional<std::string> library;
};

struct source_spec {
  std::string url;
  std::optional<std::string> tag;
  std::optional<std::string> branch;
  std::optional<std::string> hash;  // SRI or hex sha256
  std::optional<std::string> file;
  std::optional<std::string> dir;

  bool is_git() const;
  std::optional<std::string> git_ref() const { return tag ? tag : branch; }
};

struct package_descriptor {
  std::string name;
  quarry::version version;
  std::string rockspec_format;

  std::vector<dependency> dependencies;
  std::vector<dependency> build_dependencies;
  std::map<std::string, external_dependency> external_dependencies;
  std::optional<constraint> runtime_constraint;  // from a "lua" dependency

  build_spec build;
  install_spec install;
  std::vector<std::string> copy_directories;

  source_spec source;
  std::string rockspec_integrity;

  // dependencies, then build_dependencies. Both are resolved and installed before the
  // package is built.
  std::vector<dependency> all_dependencies() const;
};

using descriptor_ptr = std::shared_ptr<package_descriptor const>;

struct rockspec_options {
  std::string_view os{ "linux" };  // selects build.platforms overrides
  std::optional<std::chrono::milliseconds> eval_timeout;  // default kSolUtilEvalTimeout
  std::atomic_bool const *cancel{ nullptr };
};

// Evaluates rockspec text in a sandboxed Lua state. Throws parse_error on syntax errors,
// runtime errors, missing or ill-typed fields, or evaluation outliving its deadline.
// Throws cancelled when opts.cancel is raised mid-evaluation.
descriptor_ptr rockspec_parse(std::string_view text,
                              std::string const &chunk_name = "rockspec",
                              rockspec_options const &opts = {});

// Platform names whose overrides apply on `os`, least specific first.
std::vector<std::string> rockspec_platform_chain(std::string_view os);

}  // namespace quarry
