#include "project.h"

#include "errors.h"
#include "lockfile.h"
#include "sol_util.h"
#include "tui.h"

#include <cctype>
#include <stdexcept>

namespace quarry {

namespace {

size_t skip_whitespace(std::string_view s, size_t pos) {
  while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t')) { ++pos; }
  return pos;
}

std::string_view parse_identifier(std::string_view s, size_t &pos) {
  size_t const start{ pos };
  while (pos < s.size() &&
         (std::isalnum(static_cast<unsigned char>(s[pos])) || s[pos] == '_' ||
          s[pos] == '-')) {
    ++pos;
  }
  return s.substr(start, pos - start);
}

std::optional<std::string> parse_quoted_value(std::string_view s, size_t &pos) {
  if (pos >= s.size() || s[pos] != '"') { return std::nullopt; }
  ++pos;

  std::string result;
  while (pos < s.size() && s[pos] != '"') {
    if (s[pos] == '\\' && pos + 1 < s.size() && (s[pos + 1] == '"' || s[pos + 1] == '\\')) {
      result += s[pos + 1];
      pos += 2;
      continue;
    }
    result += s[pos++];
  }

  if (pos >= s.size()) { return std::nullopt; }
  ++pos;
  return result;
}

std::optional<std::pair<std::string, std::string>> parse_directive_line(
    std::string_view line) {
  size_t pos{ skip_whitespace(line, 0) };
  if (!line.substr(pos).starts_with("--")) { return std::nullopt; }
  pos = skip_whitespace(line, pos + 2);

  constexpr std::string_view kTag{ "@quarry" };
  if (!line.substr(pos).starts_with(kTag)) { return std::nullopt; }
  pos += kTag.size();
  if (pos >= line.size() || (line[pos] != ' ' && line[pos] != '\t')) {
    return std::nullopt;
  }
  pos = skip_whitespace(line, pos);

  auto const key{ parse_identifier(line, pos) };
  if (key.empty()) { return std::nullopt; }
  pos = skip_whitespace(line, pos);

  auto value{ parse_quoted_value(line, pos) };
  if (!value) { return std::nullopt; }
  return std::make_pair(std::string{ key }, std::move(*value));
}

// A quoted entry inside the DEPENDENCIES braces. [begin, end) spans the literal and
// its trailing comma.
struct block_entry {
  size_t begin;
  size_t end;
  std::string text;
};

struct dependency_block {
  size_t open;   // index of '{'
  size_t close;  // index of the matching '}'
  std::vector<block_entry> entries;
};

dependency_block find_dependency_block(std::string_view s) {
  constexpr std::string_view kName{ "DEPENDENCIES" };
  for (size_t at{ s.find(kName) }; at != std::string_view::npos;
       at = s.find(kName, at + 1)) {
    bool const word_start{ at == 0 || !(std::isalnum(static_cast<unsigned char>(s[at - 1])) ||
                                        s[at - 1] == '_') };
    size_t pos{ at + kName.size() };
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) { ++pos; }
    if (!word_start || pos >= s.size() || s[pos] != '=') { continue; }
    ++pos;
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) { ++pos; }
    if (pos >= s.size() || s[pos] != '{') { continue; }

    dependency_block block{ .open = pos, .close = std::string_view::npos, .entries = {} };
    for (++pos; pos < s.size(); ++pos) {
      char const c{ s[pos] };
      if (c == '}') {
        block.close = pos;
        return block;
      }
      if (c == '-' && s.substr(pos).starts_with("--")) {
        pos = s.find('\n', pos);
        if (pos == std::string_view::npos) { break; }
        continue;
      }
      if (c != '"' && c != '\'') { continue; }

      size_t const begin{ pos };
      size_t const close_quote{ s.find(c, pos + 1) };
      if (close_quote == std::string_view::npos) { break; }
      block_entry e{ .begin = begin,
                     .end = close_quote + 1,
                     .text = std::string{ s.substr(begin + 1, close_quote - begin - 1) } };
      size_t after{ skip_whitespace(s, e.end) };
      if (after < s.size() && s[after] == ',') { e.end = after + 1; }
      pos = e.end - 1;
      block.entries.push_back(std::move(e));
    }
    throw std::runtime_error("unterminated DEPENDENCIES block");
  }
  throw std::runtime_error("manifest has no DEPENDENCIES = { ... } block");
}

std::string entry_name(std::string const &text) {
  try {
    return dependency::parse(text).name;
  } catch (parse_error const &) { return {}; }
}

}  // namespace

project_meta project_parse_meta(std::string_view content) {
  project_meta result;
  size_t line_start{ 0 };

  while (line_start < content.size()) {
    size_t const line_end{ content.find('\n', line_start) };
    auto const line{ content.substr(
        line_start,
        (line_end == std::string_view::npos ? content.size() : line_end) - line_start) };

    if (auto const directive{ parse_directive_line(line) }) {
      auto const &[key, value]{ *directive };
      if (key == "lua") {
        result.lua = value;
      } else if (key == "tree") {
        result.tree = value;
      } else if (key == "server") {
        result.server = value;
      } else if (key == "cache") {
        result.cache = value;
      } else {
        tui::warn("ignoring unknown directive @quarry %s", key.c_str());
      }
    }

    if (line_end == std::string_view::npos) { break; }
    line_start = line_end + 1;
  }

  return result;
}

std::filesystem::path project::tree_root() const {
  std::filesystem::path const tree{ meta.tree.value_or(kDefaultTree) };
  return tree.is_absolute() ? tree : dir() / tree;
}

std::filesystem::path project::lockfile_path() const {
  return dir() / lockfile::kFileName;
}

std::vector<dependency> project::roots() const {
  auto out{ dependencies };
  out.insert(out.end(), build_dependencies.begin(), build_dependencies.end());
  return out;
}

std::optional<std::filesystem::path> project::discover(std::filesystem::path start) {
  namespace fs = std::filesystem;

  auto cur{ fs::absolute(start) };
  for (;;) {
    auto const manifest_path{ cur / kFileName };
    if (fs::exists(manifest_path)) { return manifest_path; }

    auto const git_path{ cur / ".git" };
    if (fs::exists(git_path) && fs::is_directory(git_path)) { return std::nullopt; }

    auto const parent{ cur.parent_path() };
    if (parent == cur) { return std::nullopt; }
    cur = parent;
  }
}

std::filesystem::path project::find_manifest_path(
    std::optional<std::filesystem::path> const &explicit_path) {
  if (explicit_path) {
    auto const path{ std::filesystem::absolute(*explicit_path) };
    if (!std::filesystem::exists(path)) {
      throw std::runtime_error("manifest not found: " + path.string());
    }
    return path;
  }
  if (auto const discovered{ discover() }) { return *discovered; }
  throw std::runtime_error(std::string{ "no " } + kFileName +
                           " found in this directory or its parents");
}

std::unique_ptr<project> project::load(std::filesystem::path const &manifest_path) {
  tui::debug("Loading project from %s", manifest_path.c_str());
  return load(util_load_file_text(manifest_path), manifest_path);
}

std::unique_ptr<project> project::load(std::string const &script,
                                       std::filesystem::path const &manifest_path) {
  auto p{ std::make_unique<project>() };
  p->manifest_path = std::filesystem::absolute(manifest_path);
  p->meta = project_parse_meta(script);

  auto lua{ sol_util_make_lua_state() };
  sol_util_run_script(*lua, script, manifest_path.filename().string());

  sol::table const globals = (*lua)["_G"];
  auto const context{ manifest_path.filename().string() };

  sol::object const deps{ globals["DEPENDENCIES"] };
  if (deps.get_type() != sol::type::table) {
    throw std::runtime_error(context + ": DEPENDENCIES must be a table of strings");
  }
  for (auto const &text : sol_util_get_string_list(globals, "DEPENDENCIES", context)) {
    p->dependencies.push_back(dependency::parse(text));
  }
  for (auto const &text : sol_util_get_string_list(globals, "BUILD_DEPENDENCIES", context)) {
    p->build_dependencies.push_back(dependency::parse(text));
  }

  if (auto const vars{ sol_util_get_optional<sol::table>(globals, "VARIABLES", context) }) {
    for (auto const &[k, v] : *vars) {
      if (k.get_type() != sol::type::string || v.get_type() != sol::type::string) {
        throw std::runtime_error(context + ": VARIABLES must map strings to strings");
      }
      p->variables[k.as<std::string>()] = v.as<std::string>();
    }
  }

  return p;
}

void project::add_dependency(std::string const &text) {
  auto const dep{ dependency::parse(text) };
  auto const updated{ project_add_dependency_text(util_load_file_text(manifest_path), dep) };
  util_write_file_atomic(manifest_path, updated);

  std::erase_if(dependencies, [&](dependency const &d) { return d.name == dep.name; });
  dependencies.push_back(dep);
  tui::info("Added %s to %s", dep.to_string().c_str(), manifest_path.c_str());
}

bool project::remove_dependency(std::string const &name) {
  auto const updated{ project_remove_dependency_text(util_load_file_text(manifest_path),
                                                     name) };
  if (!updated) { return false; }
  util_write_file_atomic(manifest_path, *updated);
  std::erase_if(dependencies, [&](dependency const &d) { return d.name == name; });
  return true;
}

std::string project_add_dependency_text(std::string_view manifest, dependency const &dep) {
  std::string out{ manifest };
  if (auto const removed{ project_remove_dependency_text(out, dep.name) }) {
    out = *removed;
  }

  auto const block{ find_dependency_block(out) };
  std::string const literal{ "\"" + dep.to_string() + "\"" };

  if (block.entries.empty()) {
    out.replace(block.open + 1, block.close - block.open - 1, "\n  " + literal + ",\n");
    return out;
  }

  auto const &last{ block.entries.back() };
  size_t close{ block.close };
  if (out[last.end - 1] != ',') {
    out.insert(last.end, ",");
    ++close;
  }

  // After the last entry's line, so a trailing comment stays with its entry.
  size_t at{ out.find('\n', last.end) };
  if (at == std::string::npos || at > close) { at = close; }
  out.insert(at, "\n  " + literal + ",");
  return out;
}

std::optional<std::string> project_remove_dependency_text(std::string_view manifest,
                                                          std::string const &name) {
  auto const block{ find_dependency_block(manifest) };
  auto const target{ util_to_lower(name) };

  for (auto it{ block.entries.rbegin() }; it != block.entries.rend(); ++it) {
    if (entry_name(it->text) != target) { continue; }

    // Take the whole line when the entry is alone on it.
    size_t begin{ it->begin };
    size_t end{ it->end };
    size_t const line_start{ manifest.rfind('\n', begin) };
    bool const alone{ line_start != std::string_view::npos && line_start > block.open &&
                      manifest.substr(line_start + 1, begin - line_start - 1)
                              .find_first_not_of(" \t") == std::string_view::npos };
    size_t const rest{ skip_whitespace(manifest, end) };
    if (alone && rest < manifest.size() && manifest[rest] == '\n') {
      begin = line_start;
      end = rest;
    } else {
      end = skip_whitespace(manifest, end);
    }

    std::string out{ manifest };
    out.erase(begin, end - begin);
    return out;
  }
  return std::nullopt;
}

}  // namespace quarry
