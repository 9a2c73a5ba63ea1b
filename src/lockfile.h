#pragma once

#include "constraint.h"
#include "resolver.h"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quarry {

struct lock_hashes {
  std::string rockspec;  // SRI of the rockspec bytes
  std::string source;    // SRI of the fetched source artifact

  bool operator==(lock_hashes const &) const = default;
};

struct lock_entry {
  std::string version;
  bool pinned{ false };
  std::optional<std::string> constraint;  // root request text; absent for transitive
  std::string source;
  std::map<std::string, std::string> dependencies;  // name -> locked version
  lock_hashes hashes;

  bool operator==(lock_entry const &) const = default;
};

struct lockfile_data {
  std::string format_version{ "1.0.0" };
  std::string runtime;
  std::vector<std::string> entrypoints;  // sorted
  std::map<std::string, lock_entry> rocks;

  bool operator==(lockfile_data const &) const = default;
};

struct lockfile_change {
  std::string name;
  std::string old_version;
  std::string new_version;

  bool operator==(lockfile_change const &) const = default;
};

struct lockfile_diff {
  std::vector<std::string> added;
  std::vector<std::string> removed;
  std::vector<lockfile_change> changed;

  bool empty() const { return added.empty() && removed.empty() && changed.empty(); }
};

struct lockfile_sync_plan {
  std::vector<dependency> to_add;      // requests no current entrypoint satisfies
  std::vector<std::string> to_remove;  // locked rocks unreachable from kept entrypoints
};

namespace lockfile {

inline constexpr char const *kFormatVersion{ "1.0.0" };
inline constexpr char const *kFileName{ "quarry.lock" };

// Throws parse_error on malformed JSON, bad fields or a newer major format version.
lockfile_data parse(std::string_view json, std::string const &origin = "lockfile");

// Pretty-printed JSON with sorted keys; identical data serializes identically.
std::string serialize(lockfile_data const &data);

// std::nullopt when the file does not exist.
std::optional<lockfile_data> load(std::filesystem::path const &path);

// Writes to a sibling temp file, flushes, then renames over `path`.
void save(std::filesystem::path const &path, lockfile_data const &data);

lockfile_diff diff(lockfile_data const &before, lockfile_data const &after);

// `source_hashes` maps node name to the SRI of its fetched source. Pin state carries
// over from `previous` for rocks that keep their version.
lockfile_data from_graph(resolved_graph const &graph,
                         std::string const &runtime,
                         std::map<std::string, std::string> const &source_hashes,
                         lockfile_data const *previous = nullptr);

// Throws std::invalid_argument for an unknown rock or when the state would not change.
void set_pinned(lockfile_data &data, std::string const &name, bool pinned);

lockfile_sync_plan sync_plan(lockfile_data const &data,
                             std::vector<dependency> const &requests);

// Locked rocks outside the dependency closure of `roots`, whatever versions the roots
// are locked at. Sorted.
std::vector<std::string> unreachable(lockfile_data const &data,
                                     std::vector<std::string> const &roots);

}  // namespace lockfile

}  // namespace quarry
