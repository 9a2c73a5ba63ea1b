#include "constraint.h"

#include "errors.h"
#include "util.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace quarry {

namespace {

struct op_token {
  std::string_view text;
  constraint_op op;
};

// Longest tokens first so ">=" wins over ">".
constexpr std::array<op_token, 8> kOpTokens{ {
    { "==", constraint_op::eq },
    { "~=", constraint_op::ne },
    { ">=", constraint_op::ge },
    { "<=", constraint_op::le },
    { "~>", constraint_op::pessimistic },
    { ">", constraint_op::gt },
    { "<", constraint_op::lt },
    { "=", constraint_op::eq },
} };

std::string decode_entities(std::string_view text) {
  static constexpr std::array<std::pair<std::string_view, char>, 3> kEntities{ {
      { "&gt;", '>' },
      { "&lt;", '<' },
      { "&amp;", '&' },
  } };

  std::string out;
  out.reserve(text.size());
  for (std::size_t i{ 0 }; i < text.size();) {
    bool replaced{ false };
    for (auto const &[entity, ch] : kEntities) {
      if (text.substr(i, entity.size()) == entity) {
        out += ch;
        i += entity.size();
        replaced = true;
        break;
      }
    }
    if (!replaced) { out += text[i++]; }
  }
  return out;
}

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

bool is_operator_char(char c) {
  return c == '=' || c == '~' || c == '<' || c == '>' || c == '@' || c == '!' ||
         c == ',';
}

bool is_name_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' ||
         c == '.' || c == '/';
}

std::size_t skip_spaces(std::string_view s, std::size_t pos) {
  while (pos < s.size() && is_space(s[pos])) { ++pos; }
  return pos;
}

version parse_clause_version(std::string_view full,
                             std::size_t begin,
                             std::size_t end) {
  auto const text{ full.substr(begin, end - begin) };
  if (util_trim(text).empty()) {
    throw parse_error("expected a version", begin, full);
  }
  try {
    return version::parse(text);
  } catch (parse_error const &e) {
    throw parse_error(e.reason(), begin + e.offset(), full);
  }
}

// Bound for "~> v": v's release components with the last one bumped, so "~> 1.2"
// admits 1.2.x but not 1.3.
version pessimistic_upper(version const &target) {
  auto const k{ target.release_component_count() };
  std::vector<std::int64_t> parts(target.components().begin(),
                                  target.components().begin() +
                                      static_cast<std::ptrdiff_t>(k));
  if (parts.empty()) { parts.push_back(0); }
  ++parts.back();
  return version::from_components(std::move(parts));
}

std::strong_ordering compare_for_clause(version const &v, version const &target) {
  return target.has_specrev() ? v <=> target : v.compare_modrev(target);
}

}  // namespace

std::string_view constraint_op_text(constraint_op op) {
  switch (op) {
    case constraint_op::eq: return "==";
    case constraint_op::ne: return "~=";
    case constraint_op::ge: return ">=";
    case constraint_op::le: return "<=";
    case constraint_op::gt: return ">";
    case constraint_op::lt: return "<";
    case constraint_op::pessimistic: return "~>";
  }
  return "?";
}

bool constraint_clause::satisfied_by(version const &v) const {
  auto const cmp{ compare_for_clause(v, target) };
  switch (op) {
    case constraint_op::eq: return cmp == 0;
    case constraint_op::ne: return cmp != 0;
    case constraint_op::ge: return cmp >= 0;
    case constraint_op::le: return cmp <= 0;
    case constraint_op::gt: return cmp > 0;
    case constraint_op::lt: return cmp < 0;
    case constraint_op::pessimistic:
      if (target.is_dev()) { return cmp == 0; }
      return cmp >= 0 && v.compare_modrev(pessimistic_upper(target)) < 0;
  }
  return false;
}

std::string constraint_clause::to_string() const {
  return std::string{ constraint_op_text(op) } + " " + target.text();
}

constraint constraint::parse(std::string_view raw) {
  auto const text{ decode_entities(raw) };
  std::string_view const full{ text };

  constraint result;
  if (util_trim(full).empty()) { return result; }

  std::size_t pos{ 0 };
  while (pos <= full.size()) {
    auto const comma{ std::min(full.find(',', pos), full.size()) };
    auto const start{ skip_spaces(full, pos) };
    if (start >= comma) { throw parse_error("empty constraint clause", start, full); }

    std::size_t cursor{ start };
    constraint_op op{ constraint_op::eq };
    if (full[cursor] == '@') {
      ++cursor;
    } else {
      for (auto const &tok : kOpTokens) {
        if (full.substr(cursor, tok.text.size()) == tok.text) {
          op = tok.op;
          cursor += tok.text.size();
          break;
        }
      }
    }

    cursor = skip_spaces(full, cursor);
    if (cursor < comma && is_operator_char(full[cursor])) {
      throw parse_error(std::string{ "unexpected '" } + full[cursor] + "'", cursor, full);
    }

    result.clauses_.push_back(
        constraint_clause{ .op = op, .target = parse_clause_version(full, cursor, comma) });

    if (comma == full.size()) { break; }
    pos = comma + 1;
  }

  return result;
}

bool constraint::satisfied_by(version const &v) const {
  return std::ranges::all_of(clauses_, [&](auto const &c) { return c.satisfied_by(v); });
}

bool constraint::names_prerelease() const {
  return std::ranges::any_of(clauses_, [](auto const &c) {
    return c.target.is_dev() || c.target.is_prerelease();
  });
}

std::string constraint::to_string() const {
  std::string out;
  for (auto const &c : clauses_) {
    if (!out.empty()) { out += ", "; }
    out += c.to_string();
  }
  return out;
}

std::optional<version> best_match(constraint const &c,
                                  std::vector<version> const &candidates,
                                  match_options const &opts) {
  bool const allow_unstable{ opts.allow_prerelease || c.names_prerelease() };

  std::optional<version> best;
  for (auto const &v : candidates) {
    if (!allow_unstable && (v.is_dev() || v.is_prerelease())) { continue; }
    if (!c.satisfied_by(v)) { continue; }
    if (!best || v > *best) { best = v; }
  }
  return best;
}

dependency dependency::parse(std::string_view raw) {
  auto const text{ decode_entities(raw) };
  std::string_view const full{ text };

  auto const start{ skip_spaces(full, 0) };
  std::size_t end{ start };
  while (end < full.size() && !is_space(full[end]) && !is_operator_char(full[end])) {
    if (!is_name_char(full[end])) {
      throw parse_error(std::string{ "invalid character '" } + full[end] +
                            "' in package name",
                        end,
                        full);
    }
    ++end;
  }

  if (end == start) { throw parse_error("expected a package name", start, full); }

  dependency dep{ .name = util_to_lower(full.substr(start, end - start)) };
  try {
    dep.version_constraint = constraint::parse(full.substr(end));
  } catch (parse_error const &e) {
    throw parse_error(e.reason(), end + e.offset(), full);
  }
  return dep;
}

std::string dependency::to_string() const {
  if (version_constraint.is_any()) { return name; }
  return name + " " + version_constraint.to_string();
}

}  // namespace quarry
