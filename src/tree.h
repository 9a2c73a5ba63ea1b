#pragma once

#include "cache.h"
#include "util.h"

#include <filesystem>
#include <string>
#include <vector>

namespace quarry {

struct installed_package {
  std::string name;
  std::string version;
  std::filesystem::path pkg_path;  // prefix holding lua/, lib/, bin/, conf/, doc/
};

// Install tree: one prefix per package at <root>/<runtime>/<name>@<version>. Prefixes
// are populated through the same lock-then-promote entries the cache uses.
class tree : unmovable {
 public:
  tree(std::filesystem::path root, std::string runtime, std::string lib_extension = "so");

  std::filesystem::path const &root() const { return root_; }
  std::string const &runtime() const { return runtime_; }

  std::filesystem::path entry_dir(std::string const &name, std::string const &version) const;

  // Lock is set when the caller must write install_dir() and mark it complete.
  cache::ensure_result ensure_package(std::string const &name, std::string const &version);

  bool installed(std::string const &name, std::string const &version) const;
  void remove(std::string const &name, std::string const &version);

  // Complete packages, sorted by name then version.
  std::vector<installed_package> packages() const;

  std::string lua_path() const;   // ?.lua and ?/init.lua under each lua/
  std::string lua_cpath() const;  // ?.<ext> under each lib/
  std::string bin_path() const;   // each bin/ that exists

 private:
  std::filesystem::path runtime_dir() const { return root_ / runtime_; }
  std::filesystem::path locks_dir() const { return runtime_dir() / ".locks"; }

  std::filesystem::path root_;
  std::string runtime_;
  std::string lib_extension_;
};

}  // namespace quarry
