#include "registry_manifest.h"

#include "errors.h"
#include "sol_util.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <stdexcept>

namespace quarry {

namespace {

bool offers_rockspec(sol::object const &entries) {
  if (entries.get_type() != sol::type::table) { return false; }
  auto const list{ entries.as<sol::table>() };
  for (std::size_t i{ 1 }, n{ list.size() }; i <= n; ++i) {
    sol::object const entry{ list[i] };
    if (entry.get_type() != sol::type::table) { continue; }
    sol::object const arch{ entry.as<sol::table>()["arch"] };
    if (arch.get_type() != sol::type::string) { continue; }
    auto const a{ arch.as<std::string>() };
    if (a == "rockspec" || a == "src") { return true; }
  }
  return false;
}

}  // namespace

registry_index registry_manifest_parse(std::string_view text,
                                       std::string const &chunk_name,
                                       std::optional<std::chrono::milliseconds> eval_timeout,
                                       std::atomic_bool const *cancel) {
  auto lua{ sol_util_make_sandboxed_state() };
  auto const limit{ eval_timeout.value_or(kSolUtilEvalTimeout) };
  sol_util_script_guard const guard{ *lua, limit, cancel };
  try {
    sol_util_run_script(*lua, text, chunk_name);
  } catch (std::runtime_error const &e) {
    if (guard.was_cancelled()) { throw cancelled(); }
    if (guard.timed_out()) {
      throw malformed_index(chunk_name + ": evaluation exceeded " +
                            std::to_string(limit.count()) + "ms");
    }
    throw malformed_index(e.what());
  }

  sol::object const repo{ lua->globals()["repository"] };
  if (repo.get_type() != sol::type::table) {
    throw malformed_index(chunk_name + ": missing 'repository' table");
  }

  registry_index index;
  for (auto const &[name_obj, versions_obj] : repo.as<sol::table>()) {
    if (name_obj.get_type() != sol::type::string ||
        versions_obj.get_type() != sol::type::table) {
      throw malformed_index(chunk_name + ": repository entries must be name = { ... }");
    }

    auto const name{ util_to_lower(name_obj.as<std::string>()) };
    auto &versions{ index[name] };
    for (auto const &[ver_obj, entries] : versions_obj.as<sol::table>()) {
      if (ver_obj.get_type() != sol::type::string) {
        throw malformed_index(chunk_name + ": version keys of '" + name +
                              "' must be strings");
      }
      if (!offers_rockspec(entries)) { continue; }

      auto const text_version{ ver_obj.as<std::string>() };
      if (auto v{ version::try_parse(text_version) }) {
        versions.push_back(std::move(*v));
      } else {
        tui::debug("%s: skipping unparseable version %s of %s",
                   chunk_name.c_str(),
                   text_version.c_str(),
                   name.c_str());
      }
    }

    std::ranges::sort(versions);
    versions.erase(std::unique(versions.begin(), versions.end()), versions.end());
    if (versions.empty()) { index.erase(name); }
  }

  return index;
}

}  // namespace quarry
