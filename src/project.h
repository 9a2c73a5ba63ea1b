#pragma once

#include "constraint.h"
#include "context.h"
#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quarry {

// `-- @quarry key "value"` header directives.
struct project_meta {
  std::optional<std::string> lua;
  std::optional<std::string> tree;
  std::optional<std::string> server;
  std::optional<std::string> cache;
};

project_meta project_parse_meta(std::string_view content);

// quarry.lua: the project's root dependencies and build settings.
struct project : unmovable {
  static constexpr char const *kFileName{ "quarry.lua" };
  static constexpr char const *kDefaultTree{ "lua_modules" };

  std::filesystem::path manifest_path;
  project_meta meta;
  std::vector<dependency> dependencies;
  std::vector<dependency> build_dependencies;
  variable_map variables;

  std::filesystem::path dir() const { return manifest_path.parent_path(); }
  std::string runtime() const { return meta.lua.value_or("5.4"); }
  std::filesystem::path tree_root() const;
  std::filesystem::path lockfile_path() const;

  // Root requests: DEPENDENCIES followed by BUILD_DEPENDENCIES.
  std::vector<dependency> roots() const;

  // Walks up from `start` looking for quarry.lua; stops at a directory holding .git.
  static std::optional<std::filesystem::path> discover(
      std::filesystem::path start = std::filesystem::current_path());

  static std::filesystem::path find_manifest_path(
      std::optional<std::filesystem::path> const &explicit_path);

  static std::unique_ptr<project> load(std::filesystem::path const &manifest_path);
  static std::unique_ptr<project> load(std::string const &script,
                                       std::filesystem::path const &manifest_path);

  // Adds (or replaces, by name) an entry of the DEPENDENCIES block and rewrites the
  // manifest atomically.
  void add_dependency(std::string const &text);

  // Returns false when no DEPENDENCIES entry has that name.
  bool remove_dependency(std::string const &name);
};

// Text-level edits of a DEPENDENCIES = { ... } block. Throw std::runtime_error when the
// block is missing or unterminated.
std::string project_add_dependency_text(std::string_view manifest, dependency const &dep);
std::optional<std::string> project_remove_dependency_text(std::string_view manifest,
                                                          std::string const &name);

}  // namespace quarry
