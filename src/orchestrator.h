#pragma once

#include "cache.h"
#include "context.h"
#include "errors.h"
#include "lockfile.h"
#include "resolver.h"
#include "source_fetch.h"
#include "tree.h"
#include "util.h"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quarry {

enum class node_state { pending, resolving_sources, building, installed, skipped, failed };

std::string_view node_state_name(node_state s);

struct node_failure {
  std::string name;
  std::string version;
  std::optional<error_kind> kind;  // empty for errors outside the quarry taxonomy
  std::string kind_name;           // "compile error", "integrity violation", ...
  std::string message;
};

struct install_report {
  std::map<std::string, node_state> states;
  std::vector<node_failure> failures;  // sorted by name
  std::optional<lockfile_data> lock;   // set only when every node succeeded
  bool lockfile_written{ false };

  bool ok() const { return failures.empty(); }
};

struct install_options {
  std::filesystem::path lockfile_path;  // empty: compute the lock data but do not save
  lockfile_data const *previous{ nullptr };
  std::optional<std::filesystem::path> file_root;  // anchors relative local sources

  // Invoked from worker threads as each node starts its work.
  std::function<void(std::string const &)> on_node_start;
};

// Installs a resolved graph into a tree. Each package is a node of a oneTBB flow graph
// that runs once all of its dependencies are terminal; failures stay local to the node
// and its dependents. The lockfile is written once, and only when every node succeeded.
class orchestrator : unmovable {
 public:
  orchestrator(context const &ctx, cache &c, tree &t);
  ~orchestrator();

  install_report install(resolved_graph const &graph, install_options const &opts = {});

  // Nodes that have not started fail as cancelled; running subprocesses are killed.
  void cancel();

 private:
  struct impl;
  std::unique_ptr<impl> m;
};

}  // namespace quarry
