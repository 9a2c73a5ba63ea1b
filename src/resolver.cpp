#include "resolver.h"

#include "errors.h"
#include "lockfile.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <deque>
#include <functional>
#include <stdexcept>

namespace quarry {

namespace {

constexpr char const *kRootOrigin{ "<root>" };

struct applied_constraint {
  constraint c;
  std::string origin;  // "<root>" or "name@version"
};

struct choice {
  std::vector<applied_constraint> constraints;
  std::optional<version> chosen;
  descriptor_ptr descriptor;
  int reresolutions{ 0 };

  bool satisfied_by(version const &v) const {
    return std::ranges::all_of(constraints,
                               [&](auto const &a) { return a.c.satisfied_by(v); });
  }

  bool names_prerelease() const {
    return std::ranges::any_of(constraints,
                               [](auto const &a) { return a.c.names_prerelease(); });
  }

  std::vector<std::string> describe() const {
    std::vector<std::string> out;
    for (auto const &a : constraints) {
      auto const text{ a.c.is_any() ? std::string{ "(any)" } : a.c.to_string() };
      out.push_back(text + " from " + a.origin);
    }
    return out;
  }
};

std::string origin_of(std::string const &name, version const &v) {
  return name + "@" + v.text();
}

class resolver : unmovable {
 public:
  resolver(manifest_client &client,
           std::vector<dependency> const &roots,
           std::string const &runtime,
           resolve_options const &opts)
      : client_{ client },
        roots_{ roots },
        runtime_{ version::parse(runtime) },
        opts_{ opts } {}

  resolved_graph run() {
    for (auto const &r : roots_) {
      if (r.is_runtime()) {
        if (!r.version_constraint.satisfied_by(runtime_)) {
          throw constraint_conflict(
              "lua",
              { r.version_constraint.to_string() + " from " + kRootOrigin + " (runtime " +
                runtime_.text() + ")" });
        }
        continue;
      }
      arena_[r.name].constraints.push_back({ r.version_constraint, kRootOrigin });
      worklist_.push_back(r.name);
    }

    while (!worklist_.empty()) {
      auto const name{ worklist_.front() };
      worklist_.pop_front();
      process(name);
    }

    prune_unreachable();
    auto graph{ build_graph() };
    resolved_graph_verify(graph);
    return graph;
  }

 private:
  void process(std::string const &name) {
    auto const it{ arena_.find(name) };
    if (it == arena_.end()) { return; }  // dropped by a retraction
    auto &entry{ it->second };

    if (entry.chosen) {
      if (entry.satisfied_by(*entry.chosen)) { return; }

      if (++entry.reresolutions > opts_.max_reresolutions) {
        throw resolution_did_not_converge(name, opts_.max_reresolutions);
      }
      tui::debug("resolve: %s@%s no longer satisfies its constraints, re-resolving",
                 name.c_str(),
                 entry.chosen->text().c_str());
      auto const old_origin{ origin_of(name, *entry.chosen) };
      entry.chosen.reset();
      entry.descriptor.reset();
      retract(old_origin);
      if (!arena_.contains(name)) { return; }
    }

    select(name);
  }

  std::optional<version> preferred_version(std::string const &name) const {
    if (!opts_.locked) { return std::nullopt; }
    auto const it{ opts_.locked->rocks.find(name) };
    if (it == opts_.locked->rocks.end()) { return std::nullopt; }

    auto const &locked{ it->second };
    bool const unlocked{ opts_.unlock_all || opts_.unlocked.contains(name) };
    if (unlocked && !locked.pinned) { return std::nullopt; }
    return version::try_parse(locked.version);
  }

  void select(std::string const &name) {
    auto &entry{ arena_.at(name) };
    auto const available{ client_.list_versions(name) };
    bool const allow_unstable{ opts_.allow_prerelease || entry.names_prerelease() };

    std::vector<version> candidates;
    auto const preferred{ preferred_version(name) };
    if (preferred && entry.satisfied_by(*preferred) &&
        std::ranges::find(available, *preferred) != available.end()) {
      candidates.push_back(*preferred);
    }
    for (auto it{ available.rbegin() }; it != available.rend(); ++it) {
      if (!allow_unstable && (it->is_dev() || it->is_prerelease())) { continue; }
      if (!entry.satisfied_by(*it)) { continue; }
      if (preferred && *it == *preferred) { continue; }
      candidates.push_back(*it);
    }

    for (auto const &v : candidates) {
      auto d{ client_.fetch_descriptor(name, v) };
      if (d->runtime_constraint && !d->runtime_constraint->satisfied_by(runtime_)) {
        tui::debug("resolve: skipping %s@%s, requires lua %s",
                   name.c_str(),
                   v.text().c_str(),
                   d->runtime_constraint->to_string().c_str());
        continue;
      }
      choose(name, v, std::move(d));
      return;
    }

    throw constraint_conflict(name, entry.describe());
  }

  void choose(std::string const &name, version const &v, descriptor_ptr d) {
    tui::debug("resolve: %s -> %s", name.c_str(), v.text().c_str());
    auto const origin{ origin_of(name, v) };
    for (auto const &dep : d->all_dependencies()) {
      if (dep.is_runtime()) { continue; }
      arena_[dep.name].constraints.push_back({ dep.version_constraint, origin });
      worklist_.push_back(dep.name);
    }

    auto &entry{ arena_.at(name) };
    entry.chosen = v;
    entry.descriptor = std::move(d);
  }

  // Drops every constraint that came from `origin`. Names nobody requires any more are
  // removed, which in turn retracts what they required.
  void retract(std::string const &origin) {
    std::vector<std::pair<std::string, std::optional<version>>> orphaned;
    for (auto &[name, entry] : arena_) {
      std::erase_if(entry.constraints, [&](auto const &a) { return a.origin == origin; });
      if (entry.constraints.empty()) { orphaned.emplace_back(name, entry.chosen); }
    }

    for (auto const &[name, chosen] : orphaned) {
      arena_.erase(name);
      if (chosen) { retract(origin_of(name, *chosen)); }
    }
  }

  void prune_unreachable() {
    std::set<std::string> reachable;
    std::vector<std::string> stack;
    for (auto const &r : roots_) {
      if (!r.is_runtime()) { stack.push_back(r.name); }
    }

    while (!stack.empty()) {
      auto const name{ stack.back() };
      stack.pop_back();
      if (!reachable.insert(name).second) { continue; }
      for (auto const &dep : arena_.at(name).descriptor->all_dependencies()) {
        if (!dep.is_runtime()) { stack.push_back(dep.name); }
      }
    }

    std::erase_if(arena_, [&](auto const &kv) { return !reachable.contains(kv.first); });
  }

  resolved_graph build_graph() const {
    resolved_graph graph{ .nodes = {}, .roots = roots_ };
    for (auto const &[name, entry] : arena_) {
      resolved_node node{ .name = name,
                          .version = *entry.chosen,
                          .descriptor = entry.descriptor,
                          .dependencies = {},
                          .constraint_text = std::nullopt };
      for (auto const &dep : entry.descriptor->all_dependencies()) {
        if (dep.is_runtime()) { continue; }
        if (std::ranges::find(node.dependencies, dep.name) == node.dependencies.end()) {
          node.dependencies.push_back(dep.name);
        }
      }
      graph.nodes.emplace(name, std::move(node));
    }

    for (auto const &r : roots_) {
      if (r.is_runtime()) { continue; }
      auto &text{ graph.nodes.at(r.name).constraint_text };
      auto const clause{ r.version_constraint.to_string() };
      if (!text) {
        text = clause;
      } else if (!clause.empty()) {
        *text = text->empty() ? clause : *text + ", " + clause;
      }
    }
    return graph;
  }

  manifest_client &client_;
  std::vector<dependency> const &roots_;
  version runtime_;
  resolve_options const &opts_;

  std::map<std::string, choice> arena_;
  std::deque<std::string> worklist_;
};

}  // namespace

resolved_node const &resolved_graph::at(std::string const &name) const {
  auto const it{ nodes.find(name) };
  if (it == nodes.end()) { throw std::out_of_range("no resolved node '" + name + "'"); }
  return it->second;
}

resolved_graph resolve(manifest_client &client,
                       std::vector<dependency> const &roots,
                       std::string const &runtime,
                       resolve_options const &opts) {
  return resolver{ client, roots, runtime, opts }.run();
}

void resolved_graph_verify(resolved_graph const &graph) {
  for (auto const &[name, node] : graph.nodes) {
    for (auto const &dep : node.descriptor->all_dependencies()) {
      if (dep.is_runtime()) { continue; }
      auto const it{ graph.nodes.find(dep.name) };
      if (it == graph.nodes.end()) {
        throw std::logic_error(name + " depends on unresolved " + dep.name);
      }
      if (!dep.version_constraint.satisfied_by(it->second.version)) {
        throw std::logic_error(name + " requires " + dep.to_string() + " but " +
                               it->second.version.text() + " was chosen");
      }
    }
  }

  enum class mark { unvisited, on_stack, done };
  std::map<std::string, mark> marks;
  std::vector<std::string> chain;

  std::function<void(std::string const &)> visit = [&](std::string const &name) {
    auto &m{ marks[name] };
    if (m == mark::done) { return; }
    if (m == mark::on_stack) {
      std::vector<std::string> cycle{
        std::find(chain.begin(), chain.end(), name), chain.end()
      };
      cycle.push_back(name);
      throw cyclic_dependency(std::move(cycle));
    }

    m = mark::on_stack;
    chain.push_back(name);
    for (auto const &dep : graph.at(name).dependencies) { visit(dep); }
    chain.pop_back();
    marks[name] = mark::done;
  };

  for (auto const &[name, node] : graph.nodes) { visit(name); }
}

}  // namespace quarry
