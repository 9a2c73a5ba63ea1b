#include "rockspec.h"

#include "errors.h"
#include "integrity.h"
#include "sol_util.h"
#include "uri.h"
#include "util.h"

#include <algorithm>
#include <filesystem>
#include <stdexcept>

namespace quarry {

namespace {

bool is_table(sol::object const &o) {
  return o.valid() && o.get_type() == sol::type::table;
}

bool is_nil(sol::object const &o) {
  return !o.valid() || o.get_type() == sol::type::lua_nil;
}

void deep_merge(sol::table base, sol::table const &over) {
  for (auto const &[key, value] : over) {
    if (is_table(value)) {
      sol::object const existing{ base[key] };
      if (is_table(existing)) {
        deep_merge(existing.as<sol::table>(), value.as<sol::table>());
        continue;
      }
    }
    base[key] = value;
  }
}

// Folds t.platforms[p] into t for every p in the chain, then drops t.platforms.
void apply_platform_overrides(sol::object const &obj,
                              std::vector<std::string> const &chain) {
  if (!is_table(obj)) { return; }
  auto t{ obj.as<sol::table>() };
  sol::object const platforms{ t["platforms"] };
  if (!is_table(platforms)) { return; }
  t["platforms"] = sol::lua_nil;

  auto const per_platform{ platforms.as<sol::table>() };
  for (auto const &p : chain) {
    sol::object const over{ per_platform[p] };
    if (is_table(over)) { deep_merge(t, over.as<sol::table>()); }
  }
}

std::string value_to_string(sol::object const &v, std::string const &context) {
  switch (v.get_type()) {
    case sol::type::string: return v.as<std::string>();
    case sol::type::number: {
      auto const d{ v.as<double>() };
      auto const i{ static_cast<long long>(d) };
      return static_cast<double>(i) == d ? std::to_string(i) : std::to_string(d);
    }
    case sol::type::boolean: return v.as<bool>() ? "true" : "false";
    default: throw std::runtime_error(context + " must be a string");
  }
}

std::map<std::string, std::string> get_string_map(sol::table const &t,
                                                  std::string const &key,
                                                  std::string const &context) {
  std::map<std::string, std::string> out;
  sol::object const obj{ t[key] };
  if (is_nil(obj)) { return out; }
  if (!is_table(obj)) {
    throw std::runtime_error(context + "." + key + " must be a table");
  }

  for (auto const &[k, v] : obj.as<sol::table>()) {
    if (k.get_type() != sol::type::string) {
      throw std::runtime_error(context + "." + key + " keys must be strings");
    }
    auto const name{ k.as<std::string>() };
    out[name] = value_to_string(v, context + "." + key + "." + name);
  }
  return out;
}

std::vector<std::string> get_list(sol::table const &t,
                                  std::string const &key,
                                  std::string const &context) {
  return sol_util_get_string_list(t, key, context);
}

// Array entries get a key derived from their path; hash entries keep theirs.
std::map<std::string, std::string> get_install_category(sol::table const &install,
                                                        std::string const &category,
                                                        bool module_keys) {
  std::map<std::string, std::string> out;
  sol::object const obj{ install[category] };
  if (is_nil(obj)) { return out; }
  if (!is_table(obj)) {
    throw std::runtime_error("build.install." + category + " must be a table");
  }

  for (auto const &[k, v] : obj.as<sol::table>()) {
    auto const path{ value_to_string(v, "build.install." + category) };
    if (k.get_type() == sol::type::string) {
      out[k.as<std::string>()] = path;
    } else {
      std::filesystem::path const p{ path };
      out[module_keys ? p.stem().string() : p.filename().string()] = path;
    }
  }
  return out;
}

native_module parse_native_module(std::string const &name, sol::object const &value) {
  native_module m{ .module = name };
  if (value.get_type() == sol::type::string) {
    m.sources.push_back(value.as<std::string>());
    return m;
  }

  auto const t{ value.as<sol::table>() };
  std::string const context{ "build.modules." + name };
  sol::object const first{ t[1] };
  if (!is_nil(first)) {
    for (std::size_t i{ 1 }, n{ t.size() }; i <= n; ++i) {
      sol::object const item{ t[i] };
      m.sources.push_back(value_to_string(item, context + "[" + std::to_string(i) + "]"));
    }
    return m;
  }

  m.sources = get_list(t, "sources", context);
  if (m.sources.empty()) { throw std::runtime_error(context + ".sources is required"); }
  m.incdirs = get_list(t, "incdirs", context);
  m.libdirs = get_list(t, "libdirs", context);
  m.libraries = get_list(t, "libraries", context);
  m.defines = get_list(t, "defines", context);
  return m;
}

struct parsed_modules {
  std::vector<lua_module> lua;
  std::vector<native_module> native;
  bool present{ false };
};

parsed_modules parse_modules(sol::table const &build) {
  parsed_modules out;
  sol::object const obj{ build["modules"] };
  if (is_nil(obj)) { return out; }
  if (!is_table(obj)) { throw std::runtime_error("build.modules must be a table"); }
  out.present = true;

  // Sorted by module name so builds are deterministic.
  std::map<std::string, sol::object> entries;
  for (auto const &[k, v] : obj.as<sol::table>()) {
    if (k.get_type() != sol::type::string) {
      throw std::runtime_error("build.modules keys must be module names");
    }
    entries.emplace(k.as<std::string>(), v);
  }

  for (auto const &[name, value] : entries) {
    if (value.get_type() == sol::type::string) {
      auto const path{ value.as<std::string>() };
      if (util_to_lower(std::filesystem::path{ path }.extension().string()) == ".lua") {
        out.lua.push_back(lua_module{ .module = name, .path = path });
        continue;
      }
    } else if (!is_table(value)) {
      throw std::runtime_error("build.modules." + name + " must be a path or a table");
    }
    out.native.push_back(parse_native_module(name, value));
  }
  return out;
}

external_tool_spec parse_external_tool(sol::table const &build, external_tool_kind tool) {
  external_tool_spec spec{ .tool = tool };
  constexpr std::string_view ctx{ "build" };

  spec.variables = get_string_map(build, "variables", "build");
  spec.build_pass = sol_util_get_or_default<bool>(build, "build_pass", true, ctx);
  spec.install_pass = sol_util_get_or_default<bool>(build, "install_pass", true, ctx);

  switch (tool) {
    case external_tool_kind::make:
      spec.makefile =
          sol_util_get_or_default<std::string>(build, "makefile", spec.makefile, ctx);
      spec.build_target =
          sol_util_get_or_default<std::string>(build, "build_target", "", ctx);
      spec.install_target = sol_util_get_or_default<std::string>(build,
                                                                 "install_target",
                                                                 spec.install_target,
                                                                 ctx);
      spec.build_variables = get_string_map(build, "build_variables", "build");
      spec.install_variables = get_string_map(build, "install_variables", "build");
      break;
    case external_tool_kind::cmake:
      spec.cmake_lists_content = sol_util_get_optional<std::string>(build, "cmake", ctx);
      break;
    case external_tool_kind::command:
      spec.build_command = sol_util_get_optional<std::string>(build, "build_command", ctx);
      spec.install_command =
          sol_util_get_optional<std::string>(build, "install_command", ctx);
      break;
  }
  return spec;
}

build_spec parse_build_spec(sol::table const &build, bool has_build_table) {
  auto const type{ sol_util_get_optional<std::string>(build, "type", "build") };
  std::string const tag{ type.value_or("builtin") };

  if (tag == "builtin" || tag == "module" || tag == "none") {
    auto modules{ parse_modules(build) };
    if (!modules.native.empty()) {
      return compiled_extension_spec{ .lua_modules = std::move(modules.lua),
                                      .native_modules = std::move(modules.native) };
    }
    return builtin_spec{ .modules = std::move(modules.lua),
                         .autodetect = tag != "none" && !modules.present &&
                                       (has_build_table || !type) };
  }
  if (tag == "make") { return parse_external_tool(build, external_tool_kind::make); }
  if (tag == "cmake") { return parse_external_tool(build, external_tool_kind::cmake); }
  if (tag == "command") { return parse_external_tool(build, external_tool_kind::command); }
  if (tag == "script") {
    user_script_spec spec{
      .script = sol_util_get_optional<std::string>(build, "script", "build"),
      .inline_code = sol_util_get_optional<std::string>(build, "inline", "build")
    };
    if (!spec.script && !spec.inline_code) {
      throw std::runtime_error("build.script or build.inline is required");
    }
    return spec;
  }
  if (tag == "treesitter-parser") {
    constexpr std::string_view ctx{ "build" };
    treesitter_parser_spec spec{
      .lang = sol_util_get_required<std::string>(build, "lang", ctx),
      .parser = sol_util_get_or_default<bool>(build, "parser", true, ctx),
      .generate = sol_util_get_or_default<bool>(build, "generate", false, ctx),
      .location = sol_util_get_optional<std::string>(build, "location", ctx),
      .queries = get_string_map(build, "queries", "build"),
    };
    for (auto const &[file, text] : spec.queries) {
      auto const rel{ std::filesystem::path{ file }.lexically_normal() };
      if (rel.empty() || rel.is_absolute() || *rel.begin() == "..") {
        throw std::runtime_error("build.queries key escapes the queries directory: " + file);
      }
    }
    return spec;
  }
  return unsupported_build_spec{ .tag = tag };
}

std::vector<dependency> parse_dependency_list(sol::table const &globals,
                                              std::string const &key,
                                              std::optional<constraint> *runtime) {
  std::vector<dependency> out;
  auto const texts{ sol_util_get_string_list(globals, key, "rockspec") };
  for (std::size_t i{ 0 }; i < texts.size(); ++i) {
    dependency dep;
    try {
      dep = dependency::parse(texts[i]);
    } catch (parse_error const &e) {
      throw parse_error(key + "[" + std::to_string(i + 1) + "]: " + e.reason(),
                        e.offset(),
                        texts[i]);
    }
    if (dep.is_runtime()) {
      if (runtime) { *runtime = dep.version_constraint; }
      continue;
    }
    out.push_back(std::move(dep));
  }
  return out;
}

source_spec parse_source(sol::table const &globals) {
  sol::object const obj{ globals["source"] };
  if (!is_table(obj)) { throw std::runtime_error("source table is required"); }
  auto const t{ obj.as<sol::table>() };
  constexpr std::string_view ctx{ "source" };

  source_spec s{ .url = sol_util_get_required<std::string>(t, "url", ctx),
                 .tag = sol_util_get_optional<std::string>(t, "tag", ctx),
                 .branch = sol_util_get_optional<std::string>(t, "branch", ctx),
                 .hash = sol_util_get_optional<std::string>(t, "hash", ctx),
                 .file = sol_util_get_optional<std::string>(t, "file", ctx),
                 .dir = sol_util_get_optional<std::string>(t, "dir", ctx) };
  if (s.tag && s.branch) {
    throw std::runtime_error("source: tag and branch are exclusive");
  }
  if (s.hash) {
    try {
      s.hash = integrity::normalize(*s.hash);
    } catch (parse_error const &e) {
      throw std::runtime_error("source.hash: " + e.reason());
    }
  }
  return s;
}

std::map<std::string, external_dependency> parse_external_deps(sol::table const &globals) {
  std::map<std::string, external_dependency> out;
  sol::object const obj{ globals["external_dependencies"] };
  if (is_nil(obj)) { return out; }
  if (!is_table(obj)) {
    throw std::runtime_error("external_dependencies must be a table");
  }

  for (auto const &[k, v] : obj.as<sol::table>()) {
    if (k.get_type() != sol::type::string || !is_table(v)) {
      throw std::runtime_error("external_dependencies entries must be name = { ... }");
    }
    auto const name{ k.as<std::string>() };
    auto const hints{ v.as<sol::table>() };
    std::string const ctx{ "external_dependencies." + name };
    out.emplace(name,
                external_dependency{
                    .name = name,
                    .header = sol_util_get_optional<std::string>(hints, "header", ctx),
                    .library = sol_util_get_optional<std::string>(hints, "library", ctx),
                });
  }
  return out;
}

}  // namespace

std::string_view build_spec_tag(build_spec const &spec) {
  return std::visit(
      match{
          [](builtin_spec const &) -> std::string_view { return "builtin"; },
          [](compiled_extension_spec const &) -> std::string_view { return "builtin"; },
          [](external_tool_spec const &s) -> std::string_view {
            switch (s.tool) {
              case external_tool_kind::make: return "make";
              case external_tool_kind::cmake: return "cmake";
              case external_tool_kind::command: return "command";
            }
            return "make";
          },
          [](user_script_spec const &) -> std::string_view { return "script"; },
          [](treesitter_parser_spec const &) -> std::string_view {
            return "treesitter-parser";
          },
          [](unsupported_build_spec const &s) -> std::string_view { return s.tag; },
      },
      spec);
}

std::vector<dependency> package_descriptor::all_dependencies() const {
  auto out{ dependencies };
  out.insert(out.end(), build_dependencies.begin(), build_dependencies.end());
  return out;
}

bool source_spec::is_git() const {
  return uri_classify(url).scheme == uri_scheme::GIT;
}

std::vector<std::string> rockspec_platform_chain(std::string_view os) {
  if (os == "linux") { return { "unix", "linux" }; }
  if (os == "macosx") { return { "unix", "bsd", "macosx", "macos" }; }
  if (os == "freebsd" || os == "openbsd" || os == "netbsd") {
    return { "unix", "bsd", std::string{ os } };
  }
  return { "unix", std::string{ os } };
}

descriptor_ptr rockspec_parse(std::string_view text,
                              std::string const &chunk_name,
                              rockspec_options const &opts) {
  auto lua{ sol_util_make_sandboxed_state() };
  auto const limit{ opts.eval_timeout.value_or(kSolUtilEvalTimeout) };
  sol_util_script_guard const guard{ *lua, limit, opts.cancel };
  auto const failure{ [&](std::string const &reason) {
    if (guard.was_cancelled()) { throw cancelled(); }
    return parse_error(chunk_name + ": " +
                           (guard.timed_out() ? "evaluation exceeded " +
                                                    std::to_string(limit.count()) + "ms"
                                              : reason),
                       0);
  } };

  try {
    sol_util_run_script(*lua, text, chunk_name);
  } catch (std::runtime_error const &e) { throw failure(e.what()); }

  auto d{ std::make_shared<package_descriptor>() };
  try {
    auto const globals{ lua->globals() };
    auto const chain{ rockspec_platform_chain(opts.os) };
    for (auto const *key :
         { "build", "dependencies", "build_dependencies", "external_dependencies",
           "source" }) {
      sol::object const section{ globals[key] };
      apply_platform_overrides(section, chain);
    }

    d->name =
        util_to_lower(sol_util_get_required<std::string>(globals, "package", "rockspec"));
    d->version =
        version::parse(sol_util_get_required<std::string>(globals, "version", "rockspec"));
    d->rockspec_format =
        sol_util_get_or_default<std::string>(globals, "rockspec_format", "1.0", "rockspec");

    d->dependencies =
        parse_dependency_list(globals, "dependencies", &d->runtime_constraint);
    d->build_dependencies = parse_dependency_list(globals, "build_dependencies", nullptr);
    d->external_dependencies = parse_external_deps(globals);
    d->source = parse_source(globals);

    sol::object const build_obj{ globals["build"] };
    bool const has_build_table{ is_table(build_obj) };
    if (!is_nil(build_obj) && !has_build_table) {
      throw std::runtime_error("build must be a table");
    }
    auto const build{ has_build_table ? build_obj.as<sol::table>() : lua->create_table() };
    d->build = parse_build_spec(build, has_build_table);

    sol::object const install_obj{ build["install"] };
    if (is_table(install_obj)) {
      auto const install{ install_obj.as<sol::table>() };
      d->install = install_spec{ .lua = get_install_category(install, "lua", true),
                                 .lib = get_install_category(install, "lib", true),
                                 .bin = get_install_category(install, "bin", false),
                                 .conf = get_install_category(install, "conf", false) };
    }
    d->copy_directories = sol_util_get_string_list(build, "copy_directories", "build");
    for (auto const &dir : d->copy_directories) {
      if (dir == "lua" || dir == "lib" || dir == "bin" || dir == "conf") {
        throw std::runtime_error("copy_directories entry '" + dir +
                                 "' clashes with the install layout");
      }
    }
  } catch (parse_error const &e) {
    throw parse_error(chunk_name + ": " + e.reason(), e.offset());
  } catch (std::runtime_error const &e) { throw failure(e.what()); }

  d->rockspec_integrity = integrity::of_bytes(text);
  return d;
}

}  // namespace quarry
