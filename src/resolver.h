#pragma once

#include "constraint.h"
#include "manifest_client.h"
#include "rockspec.h"
#include "version.h"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace quarry {

struct lockfile_data;

struct resolved_node {
  std::string name;
  quarry::version version;
  descriptor_ptr descriptor;
  std::vector<std::string> dependencies;      // node names, in declaration order
  std::optional<std::string> constraint_text;  // set on root requests
};

// One version per package name. Acyclic, and every edge target satisfies the constraint
// that produced it.
struct resolved_graph {
  std::map<std::string, resolved_node> nodes;
  std::vector<dependency> roots;

  resolved_node const &at(std::string const &name) const;
  bool contains(std::string const &name) const { return nodes.contains(name); }
};

struct resolve_options {
  bool allow_prerelease{ false };
  int max_reresolutions{ 3 };

  // Locked versions are tried first when they still satisfy every constraint. With
  // unlock_all only pinned entries are preferred; names in `unlocked` likewise.
  lockfile_data const *locked{ nullptr };
  bool unlock_all{ false };
  std::set<std::string> unlocked;
};

// Worklist constraint propagation over `client`. Throws constraint_conflict,
// cyclic_dependency, resolution_did_not_converge, or whatever the client throws.
resolved_graph resolve(manifest_client &client,
                       std::vector<dependency> const &roots,
                       std::string const &runtime,
                       resolve_options const &opts = {});

// Throws std::logic_error for a dangling or unsatisfied edge, cyclic_dependency for a
// cycle.
void resolved_graph_verify(resolved_graph const &graph);

}  // namespace quarry
