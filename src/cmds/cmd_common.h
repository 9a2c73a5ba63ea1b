#pragma once

#include "cache.h"
#include "cmd.h"
#include "constraint.h"
#include "context.h"
#include "lockfile.h"
#include "orchestrator.h"
#include "project.h"
#include "registry_client.h"
#include "tree.h"

#include <exception>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace quarry {

// Process exit statuses.
enum class exit_status : int {
  success = 0,
  failure = 1,
  resolution = 2,
  build = 3,
  integrity = 4,
  network = 5,
};

// One or more packages failed to install; carries the per-node report.
class install_failed : public std::runtime_error {
 public:
  explicit install_failed(install_report report);

  install_report const &report() const { return report_; }
  exit_status status() const;

 private:
  install_report report_;
};

exit_status exit_status_for(std::exception const &e);

// Everything a project command works with, configured from CLI flags, quarry.lua, the
// environment and defaults, in that order of precedence.
struct session : unmovable {
  context ctx;
  std::unique_ptr<project> proj;
  std::unique_ptr<cache> cache_;
  std::unique_ptr<registry_client> registry;
  std::unique_ptr<tree> tree_;
};

std::unique_ptr<session> session_open(global_options const &globals);

context session_context(global_options const &globals, project const &proj);

struct install_request {
  std::vector<dependency> extra_roots;
  bool use_lock{ true };           // prefer locked versions
  bool unlock_all{ false };        // prefer only pinned versions
  std::set<std::string> unlocked;  // re-resolve these names freely
};

// Resolves the project roots, installs them into the tree and rewrites the lockfile.
// Throws install_failed when any package fails.
install_report session_install(session &s, install_request const &req);

void log_lockfile_diff(lockfile_diff const &d);

}  // namespace quarry
