#include "cmd_common.h"

#include "errors.h"
#include "platform.h"
#include "resolver.h"
#include "termination.h"
#include "tui.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <thread>

namespace quarry {

namespace {

bool any_failure_of(install_report const &r, error_kind kind) {
  return std::ranges::any_of(r.failures,
                             [kind](node_failure const &f) { return f.kind == kind; });
}

// Polls the termination flag while an install runs and forwards it as a cancel.
class cancel_on_signal : unmovable {
 public:
  explicit cancel_on_signal(orchestrator &o)
      : thread_{ [this, &o] {
          while (!done_) {
            if (termination_flag()) {
              o.cancel();
              return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{ 50 });
          }
        } } {}

  ~cancel_on_signal() {
    done_ = true;
    thread_.join();
  }

 private:
  std::atomic_bool done_{ false };
  std::thread thread_;
};

}  // namespace

install_failed::install_failed(install_report report)
    : std::runtime_error(std::to_string(report.failures.size()) +
                         " package(s) failed to install"),
      report_{ std::move(report) } {}

exit_status install_failed::status() const {
  if (any_failure_of(report_, error_kind::integrity_violation)) {
    return exit_status::integrity;
  }
  if (any_failure_of(report_, error_kind::network)) { return exit_status::network; }
  if (std::ranges::all_of(report_.failures, [](node_failure const &f) {
        return f.kind == error_kind::cancelled;
      })) {
    return exit_status::failure;
  }
  return exit_status::build;
}

exit_status exit_status_for(std::exception const &e) {
  if (auto const *f{ dynamic_cast<install_failed const *>(&e) }) { return f->status(); }
  auto const *qe{ dynamic_cast<error const *>(&e) };
  if (!qe) { return exit_status::failure; }

  switch (qe->kind()) {
    case error_kind::parse:
    case error_kind::not_found:
    case error_kind::malformed_index:
    case error_kind::constraint_conflict:
    case error_kind::cyclic_dependency:
    case error_kind::did_not_converge: return exit_status::resolution;
    case error_kind::build:
    case error_kind::dependency_failed: return exit_status::build;
    case error_kind::integrity_violation: return exit_status::integrity;
    case error_kind::network: return exit_status::network;
    case error_kind::cancelled: return exit_status::failure;
  }
  return exit_status::failure;
}

context session_context(global_options const &globals, project const &proj) {
  context ctx;
  ctx.runtime = globals.lua.value_or(proj.runtime());
  ctx.tree_root = proj.tree_root();
  ctx.os = std::string{ platform::os_name() };
  ctx.jobs = globals.jobs.value_or(0);

  if (globals.server) {
    ctx.server = *globals.server;
  } else if (proj.meta.server) {
    ctx.server = *proj.meta.server;
  } else if (char const *env{ std::getenv("QUARRY_SERVER") }; env && *env) {
    ctx.server = env;
  }

  if (globals.cache_root) {
    ctx.cache_root = *globals.cache_root;
  } else if (proj.meta.cache) {
    std::filesystem::path const p{ *proj.meta.cache };
    ctx.cache_root = p.is_absolute() ? p : proj.dir() / p;
  } else if (auto const root{ platform::get_default_cache_root() }) {
    ctx.cache_root = *root;
  } else {
    throw std::runtime_error(std::string{ "could not determine cache root; set " } +
                             platform::get_default_cache_root_env_vars());
  }

  ctx.variables = context_merge_variables(context_default_variables(ctx.os), proj.variables);
  return ctx;
}

std::unique_ptr<session> session_open(global_options const &globals) {
  auto s{ std::make_unique<session>() };
  s->proj = project::load(project::find_manifest_path(globals.manifest_path));
  s->ctx = session_context(globals, *s->proj);

  tui::debug("runtime %s, tree %s, cache %s, server %s",
             s->ctx.runtime.c_str(),
             s->ctx.tree_root.c_str(),
             s->ctx.cache_root.c_str(),
             s->ctx.server.c_str());

  s->cache_ = std::make_unique<cache>(s->ctx.cache_root);
  s->registry = std::make_unique<registry_client>(
      registry_options{ .server = s->ctx.server,
                        .runtime = s->ctx.runtime,
                        .cache_dir = s->cache_->registry_dir(s->ctx.server),
                        .retries = s->ctx.network.retries,
                        .backoff_ms = s->ctx.network.backoff_ms,
                        .timeout_s = s->ctx.network.timeout_s,
                        .os = s->ctx.os,
                        .cancel = &termination_flag() });
  s->tree_ = std::make_unique<tree>(s->ctx.tree_root,
                                    s->ctx.runtime,
                                    s->ctx.variables.at("LIB_EXTENSION"));
  return s;
}

install_report session_install(session &s, install_request const &req) {
  auto const lock_path{ s.proj->lockfile_path() };
  auto const previous{ lockfile::load(lock_path) };

  auto roots{ s.proj->roots() };
  for (auto const &extra : req.extra_roots) {
    std::erase_if(roots, [&](dependency const &d) { return d.name == extra.name; });
    roots.push_back(extra);
  }

  resolve_options const ropts{ .allow_prerelease = s.ctx.allow_prerelease,
                               .locked = req.use_lock && previous ? &*previous : nullptr,
                               .unlock_all = req.unlock_all,
                               .unlocked = req.unlocked };
  auto const graph{ resolve(*s.registry, roots, s.ctx.runtime, ropts) };
  tui::info("Resolved %zu packages", graph.nodes.size());

  orchestrator o{ s.ctx, *s.cache_, *s.tree_ };
  install_report report;
  {
    cancel_on_signal const watcher{ o };
    report = o.install(graph,
                       install_options{ .lockfile_path = lock_path,
                                        .previous = previous ? &*previous : nullptr,
                                        .file_root = s.proj->dir() });
  }
  if (!report.ok()) { throw install_failed(std::move(report)); }

  if (previous) {
    log_lockfile_diff(lockfile::diff(*previous, *report.lock));
  } else {
    tui::info("Wrote %s", lock_path.c_str());
  }
  return report;
}

void log_lockfile_diff(lockfile_diff const &d) {
  if (d.empty()) {
    tui::info("Lockfile unchanged");
    return;
  }
  for (auto const &name : d.added) { tui::info("  + %s", name.c_str()); }
  for (auto const &name : d.removed) { tui::info("  - %s", name.c_str()); }
  for (auto const &c : d.changed) {
    tui::info("  ~ %s %s -> %s",
              c.name.c_str(),
              c.old_version.c_str(),
              c.new_version.c_str());
  }
}

}  // namespace quarry
