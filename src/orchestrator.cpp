#include "orchestrator.h"

#include "backends/build_backend.h"
#include "integrity.h"
#include "platform.h"
#include "tui.h"

#include <tbb/flow_graph.h>
#include <tbb/task_arena.h>

#include <algorithm>
#include <atomic>
#include <mutex>

namespace quarry {

std::string_view node_state_name(node_state s) {
  switch (s) {
    case node_state::pending: return "pending";
    case node_state::resolving_sources: return "resolving_sources";
    case node_state::building: return "building";
    case node_state::installed: return "installed";
    case node_state::skipped: return "skipped";
    case node_state::failed: return "failed";
  }
  return "unknown";
}

namespace {

using flow_node = tbb::flow::continue_node<tbb::flow::continue_msg>;

struct node_record {
  resolved_node const *node{ nullptr };
  lock_entry const *locked{ nullptr };  // previous lock entry at the same version
  std::atomic<node_state> state{ node_state::pending };
  std::unique_ptr<flow_node> flow;
};

bool terminal_ok(node_state s) {
  return s == node_state::installed || s == node_state::skipped;
}

node_failure describe_failure(resolved_node const &n, std::exception const &e) {
  node_failure f{ .name = n.name, .version = n.version.text(), .message = e.what() };
  if (auto const *be{ dynamic_cast<build_error const *>(&e) }) {
    f.kind = error_kind::build;
    f.kind_name = std::string{ build_error_kind_name(be->build_kind()) };
  } else if (auto const *qe{ dynamic_cast<error const *>(&e) }) {
    f.kind = qe->kind();
    f.kind_name = std::string{ error_kind_name(qe->kind()) };
  } else {
    f.kind_name = "error";
  }
  return f;
}

}  // namespace

struct orchestrator::impl {
  context const &ctx;
  cache &cache_;
  tree &tree_;
  std::atomic_bool cancel_flag{ false };

  std::mutex mutex;
  std::vector<node_failure> failures;
  std::map<std::string, std::string> source_hashes;

  impl(context const &c, cache &ca, tree &t) : ctx{ c }, cache_{ ca }, tree_{ t } {}

  void record_failure(node_record &r, std::exception const &e) {
    r.state = node_state::failed;
    auto f{ describe_failure(*r.node, e) };
    tui::error("%s@%s: %s: %s",
               f.name.c_str(),
               f.version.c_str(),
               f.kind_name.c_str(),
               f.message.c_str());
    std::lock_guard const lock{ mutex };
    failures.push_back(std::move(f));
  }

  void record_source_hash(std::string const &name, std::string sri) {
    std::lock_guard const lock{ mutex };
    source_hashes[name] = std::move(sri);
  }

  void verify_locked(node_record const &r, fetched_source const &fetched) const {
    if (!r.locked) { return; }
    auto const subject{ r.node->name + "@" + r.node->version.text() };
    integrity::verify(r.locked->hashes.rockspec,
                      r.node->descriptor->rockspec_integrity,
                      subject + " rockspec");
    integrity::verify(r.locked->hashes.source, fetched.integrity, subject + " source");
  }

  void run_node(node_record &r,
                std::map<std::string, node_record> const &records,
                install_options const &opts) {
    auto const &n{ *r.node };
    auto const &d{ *n.descriptor };
    auto const version_text{ n.version.text() };

    if (cancel_flag) { throw cancelled(); }
    for (auto const &dep : n.dependencies) {
      if (!terminal_ok(records.at(dep).state)) { throw dependency_failed(dep); }
    }
    if (opts.on_node_start) { opts.on_node_start(n.name); }

    // Installed prefixes are still re-verified against the lock before being kept.
    r.state = node_state::resolving_sources;
    source_fetch_options const fetch_opts{
      .file_root = opts.file_root,
      .http = http_options{ .timeout_s = ctx.network.timeout_s, .cancel = &cancel_flag }
    };
    auto const fetched{ source_fetch(cache_, d, fetch_opts) };
    verify_locked(r, fetched);
    record_source_hash(n.name, fetched.integrity);

    if (r.locked && tree_.installed(n.name, version_text)) {
      tui::debug("%s@%s already installed", n.name.c_str(), version_text.c_str());
      r.state = node_state::skipped;
      return;
    }

    auto entry{ tree_.ensure_package(n.name, version_text) };
    if (!entry.lock) {
      tui::debug("%s@%s already installed", n.name.c_str(), version_text.c_str());
      r.state = node_state::skipped;
      return;
    }

    auto const work{ entry.lock->work_dir() };
    auto const source_dir{ source_unpack(fetched, d, work / "unpack", &cancel_flag) };
    if (cancel_flag) { throw cancelled(); }

    r.state = node_state::building;
    tui::info("Building %s %s", n.name.c_str(), version_text.c_str());
    build_context const bctx{ .source_dir = source_dir,
                              .scratch_dir = work / "scratch",
                              .runtime = ctx.runtime,
                              .variables = ctx.variables,
                              .cancel = &cancel_flag,
                              .header_cache = &cache_ };
    auto const files{ build_backend_run(d, bctx) };
    if (cancel_flag) { throw cancelled(); }

    installed_files_write(files, entry.lock->install_dir());
    entry.lock->mark_install_complete();
    entry.lock.reset();

    r.state = node_state::installed;
    tui::info("Installed %s %s", n.name.c_str(), version_text.c_str());
  }

  void execute(std::map<std::string, node_record> &records, install_options const &opts) {
    unsigned const jobs{ ctx.jobs ? ctx.jobs : platform::hardware_concurrency() };
    tbb::task_arena arena{ static_cast<int>(std::max(jobs, 1u)) };

    arena.execute([&] {
      tbb::flow::graph g;
      tbb::flow::broadcast_node<tbb::flow::continue_msg> kickoff{ g };

      for (auto &[name, r] : records) {
        r.flow = std::make_unique<flow_node>(
            g,
            [this, &r, &records, &opts](tbb::flow::continue_msg const &) {
              try {
                run_node(r, records, opts);
              } catch (std::exception const &e) { record_failure(r, e); }
            });
      }

      for (auto &[name, r] : records) {
        if (r.node->dependencies.empty()) {
          tbb::flow::make_edge(kickoff, *r.flow);
          continue;
        }
        for (auto const &dep : r.node->dependencies) {
          tbb::flow::make_edge(*records.at(dep).flow, *r.flow);
        }
      }

      kickoff.try_put(tbb::flow::continue_msg{});
      g.wait_for_all();
    });
  }
};

orchestrator::orchestrator(context const &ctx, cache &c, tree &t)
    : m{ std::make_unique<impl>(ctx, c, t) } {}

orchestrator::~orchestrator() = default;

void orchestrator::cancel() { m->cancel_flag = true; }

install_report orchestrator::install(resolved_graph const &graph,
                                     install_options const &opts) {
  resolved_graph_verify(graph);
  {
    std::lock_guard const lock{ m->mutex };
    m->failures.clear();
    m->source_hashes.clear();
  }

  std::map<std::string, node_record> records;
  for (auto const &[name, node] : graph.nodes) {
    auto &r{ records[name] };
    r.node = &node;
    if (opts.previous) {
      auto const it{ opts.previous->rocks.find(name) };
      if (it != opts.previous->rocks.end() && it->second.version == node.version.text()) {
        r.locked = &it->second;
      }
    }
  }

  tui::debug("orchestrator: %zu packages", records.size());
  m->execute(records, opts);

  install_report report;
  for (auto const &[name, r] : records) { report.states[name] = r.state; }
  {
    std::lock_guard const lock{ m->mutex };
    report.failures = m->failures;
  }
  std::ranges::sort(report.failures, {}, &node_failure::name);

  if (!report.ok()) {
    tui::warn("%zu of %zu packages failed; lockfile not written",
              report.failures.size(),
              records.size());
    return report;
  }

  report.lock = lockfile::from_graph(graph, m->ctx.runtime, m->source_hashes, opts.previous);
  if (!opts.lockfile_path.empty()) {
    lockfile::save(opts.lockfile_path, *report.lock);
    report.lockfile_written = true;
    tui::debug("wrote %s", opts.lockfile_path.c_str());
  }
  return report;
}

}  // namespace quarry
