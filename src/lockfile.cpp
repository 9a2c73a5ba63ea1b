#include "lockfile.h"

#include "errors.h"
#include "platform.h"
#include "tui.h"
#include "util.h"

#include "picojson.h"
#include "semver.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace quarry::lockfile {

namespace {

// Lockfiles from this major version onwards are not understood.
constexpr char const *kUnsupportedFormat{ "2.0.0" };

[[noreturn]] void fail(std::string const &origin, std::string const &reason) {
  throw parse_error(origin + ": " + reason, 0);
}

picojson::object const &as_object(picojson::value const &v,
                                  std::string const &origin,
                                  std::string const &what) {
  if (!v.is<picojson::object>()) { fail(origin, what + " must be an object"); }
  return v.get<picojson::object>();
}

std::string const &get_string(picojson::object const &obj,
                              std::string const &key,
                              std::string const &origin,
                              std::string const &what) {
  auto const it{ obj.find(key) };
  if (it == obj.end() || !it->second.is<std::string>()) {
    fail(origin, what + "." + key + " must be a string");
  }
  return it->second.get<std::string>();
}

void check_format_version(std::string const &text, std::string const &origin) {
  semver::version<> file_version;
  if (!semver::parse(text, file_version)) {
    fail(origin, "format version '" + text + "' is not semver");
  }
  semver::version<> unsupported;
  if (!semver::parse(kUnsupportedFormat, unsupported)) {
    throw std::logic_error("bad unsupported-format constant");
  }
  if (file_version >= unsupported) {
    fail(origin,
         "format version " + text + " is newer than supported " + kFormatVersion);
  }
}

lock_entry parse_entry(std::string const &name,
                       picojson::value const &v,
                       std::string const &origin) {
  std::string const what{ "rocks." + name };
  auto const &obj{ as_object(v, origin, what) };

  lock_entry entry{ .version = get_string(obj, "version", origin, what),
                    .pinned = false,
                    .constraint = std::nullopt,
                    .source = get_string(obj, "source", origin, what),
                    .dependencies = {},
                    .hashes = {} };
  if (!version::try_parse(entry.version)) {
    fail(origin, what + ".version '" + entry.version + "' is not a rock version");
  }

  if (auto const it{ obj.find("pinned") }; it != obj.end()) {
    if (!it->second.is<bool>()) { fail(origin, what + ".pinned must be a boolean"); }
    entry.pinned = it->second.get<bool>();
  }

  if (auto const it{ obj.find("constraint") };
      it != obj.end() && !it->second.is<picojson::null>()) {
    if (!it->second.is<std::string>()) {
      fail(origin, what + ".constraint must be a string or null");
    }
    entry.constraint = it->second.get<std::string>();
  }

  if (auto const it{ obj.find("dependencies") }; it != obj.end()) {
    for (auto const &[dep, ver] : as_object(it->second, origin, what + ".dependencies")) {
      if (!ver.is<std::string>()) {
        fail(origin, what + ".dependencies." + dep + " must be a string");
      }
      entry.dependencies[dep] = ver.get<std::string>();
    }
  }

  auto const hashes_it{ obj.find("hashes") };
  if (hashes_it == obj.end()) { fail(origin, what + ".hashes is required"); }
  auto const &hashes{ as_object(hashes_it->second, origin, what + ".hashes") };
  entry.hashes.rockspec = get_string(hashes, "rockspec", origin, what + ".hashes");
  entry.hashes.source = get_string(hashes, "source", origin, what + ".hashes");
  return entry;
}

picojson::value entry_to_json(lock_entry const &e) {
  picojson::object deps;
  for (auto const &[name, ver] : e.dependencies) { deps[name] = picojson::value{ ver }; }

  picojson::object hashes;
  hashes["rockspec"] = picojson::value{ e.hashes.rockspec };
  hashes["source"] = picojson::value{ e.hashes.source };

  picojson::object obj;
  obj["version"] = picojson::value{ e.version };
  obj["pinned"] = picojson::value{ e.pinned };
  obj["constraint"] = e.constraint ? picojson::value{ *e.constraint } : picojson::value{};
  obj["source"] = picojson::value{ e.source };
  obj["dependencies"] = picojson::value{ deps };
  obj["hashes"] = picojson::value{ hashes };
  return picojson::value{ obj };
}

}  // namespace

lockfile_data parse(std::string_view json, std::string const &origin) {
  picojson::value root;
  if (auto const err{ picojson::parse(root, std::string{ json }) }; !err.empty()) {
    fail(origin, err);
  }
  auto const &obj{ as_object(root, origin, "document") };

  lockfile_data data;
  data.format_version = get_string(obj, "version", origin, "document");
  check_format_version(data.format_version, origin);
  data.runtime = get_string(obj, "runtime", origin, "document");

  if (auto const it{ obj.find("entrypoints") }; it != obj.end()) {
    if (!it->second.is<picojson::array>()) {
      fail(origin, "entrypoints must be an array");
    }
    for (auto const &e : it->second.get<picojson::array>()) {
      if (!e.is<std::string>()) { fail(origin, "entrypoints must hold strings"); }
      data.entrypoints.push_back(e.get<std::string>());
    }
  }

  if (auto const it{ obj.find("rocks") }; it != obj.end()) {
    for (auto const &[name, v] : as_object(it->second, origin, "rocks")) {
      data.rocks.emplace(name, parse_entry(name, v, origin));
    }
  }

  for (auto const &e : data.entrypoints) {
    if (!data.rocks.contains(e)) { fail(origin, "entrypoint '" + e + "' is not locked"); }
  }
  return data;
}

std::string serialize(lockfile_data const &data) {
  picojson::array entrypoints;
  for (auto const &e : data.entrypoints) { entrypoints.emplace_back(e); }

  picojson::object rocks;
  for (auto const &[name, entry] : data.rocks) { rocks[name] = entry_to_json(entry); }

  picojson::object root;
  root["version"] = picojson::value{ data.format_version };
  root["runtime"] = picojson::value{ data.runtime };
  root["entrypoints"] = picojson::value{ entrypoints };
  root["rocks"] = picojson::value{ rocks };
  return picojson::value{ root }.serialize(true);
}

std::optional<lockfile_data> load(std::filesystem::path const &path) {
  if (!platform::file_exists(path)) { return std::nullopt; }
  return parse(util_load_file_text(path), path.string());
}

void save(std::filesystem::path const &path, lockfile_data const &data) {
  util_write_file_atomic(path, serialize(data));
  tui::debug("wrote %s (%zu rocks)", path.c_str(), data.rocks.size());
}

lockfile_diff diff(lockfile_data const &before, lockfile_data const &after) {
  lockfile_diff out;
  for (auto const &[name, entry] : after.rocks) {
    auto const it{ before.rocks.find(name) };
    if (it == before.rocks.end()) {
      out.added.push_back(name);
    } else if (it->second.version != entry.version) {
      out.changed.push_back({ name, it->second.version, entry.version });
    }
  }
  for (auto const &[name, entry] : before.rocks) {
    if (!after.rocks.contains(name)) { out.removed.push_back(name); }
  }
  return out;
}

lockfile_data from_graph(resolved_graph const &graph,
                         std::string const &runtime,
                         std::map<std::string, std::string> const &source_hashes,
                         lockfile_data const *previous) {
  lockfile_data data{ .format_version = kFormatVersion,
                      .runtime = runtime,
                      .entrypoints = {},
                      .rocks = {} };

  std::set<std::string> entrypoints;
  for (auto const &r : graph.roots) {
    if (!r.is_runtime()) { entrypoints.insert(r.name); }
  }
  data.entrypoints.assign(entrypoints.begin(), entrypoints.end());

  for (auto const &[name, node] : graph.nodes) {
    lock_entry const *prior{ nullptr };
    if (previous) {
      auto const it{ previous->rocks.find(name) };
      if (it != previous->rocks.end() && it->second.version == node.version.text()) {
        prior = &it->second;
      }
    }

    lock_entry entry{ .version = node.version.text(),
                      .pinned = prior && prior->pinned,
                      .constraint = node.constraint_text,
                      .source = node.descriptor->source.url,
                      .dependencies = {},
                      .hashes = { .rockspec = node.descriptor->rockspec_integrity,
                                  .source = {} } };
    for (auto const &dep : node.dependencies) {
      entry.dependencies[dep] = graph.at(dep).version.text();
    }

    if (auto const it{ source_hashes.find(name) }; it != source_hashes.end()) {
      entry.hashes.source = it->second;
    } else if (prior) {
      entry.hashes.source = prior->hashes.source;
    } else {
      throw std::invalid_argument("no source hash for " + name + "@" + entry.version);
    }

    data.rocks.emplace(name, std::move(entry));
  }
  return data;
}

void set_pinned(lockfile_data &data, std::string const &name, bool pinned) {
  auto const it{ data.rocks.find(name) };
  if (it == data.rocks.end()) {
    throw std::invalid_argument("'" + name + "' is not in the lockfile");
  }
  if (it->second.pinned == pinned) {
    throw std::invalid_argument("'" + name + "' is already " +
                                (pinned ? "pinned" : "unpinned"));
  }
  it->second.pinned = pinned;
}

lockfile_sync_plan sync_plan(lockfile_data const &data,
                             std::vector<dependency> const &requests) {
  lockfile_sync_plan plan;
  std::set<std::string> kept;

  for (auto const &r : requests) {
    if (r.is_runtime()) { continue; }
    bool const is_entrypoint{ std::ranges::find(data.entrypoints, r.name) !=
                              data.entrypoints.end() };
    auto const it{ data.rocks.find(r.name) };
    auto const locked{ it == data.rocks.end() ? std::nullopt
                                              : version::try_parse(it->second.version) };
    if (is_entrypoint && locked && r.version_constraint.satisfied_by(*locked)) {
      kept.insert(r.name);
    } else {
      plan.to_add.push_back(r);
    }
  }

  plan.to_remove = unreachable(data, { kept.begin(), kept.end() });
  return plan;
}

std::vector<std::string> unreachable(lockfile_data const &data,
                                     std::vector<std::string> const &roots) {
  std::set<std::string> reachable;
  std::vector<std::string> stack{ roots };
  while (!stack.empty()) {
    auto const name{ stack.back() };
    stack.pop_back();
    if (!reachable.insert(name).second) { continue; }
    auto const it{ data.rocks.find(name) };
    if (it == data.rocks.end()) { continue; }
    for (auto const &[dep, ver] : it->second.dependencies) { stack.push_back(dep); }
  }

  std::vector<std::string> out;
  for (auto const &[name, entry] : data.rocks) {
    if (!reachable.contains(name)) { out.push_back(name); }
  }
  return out;
}

}  // namespace quarry::lockfile
