#pragma once

#include "version.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quarry {

enum class constraint_op { eq, ne, ge, le, gt, lt, pessimistic };

std::string_view constraint_op_text(constraint_op op);

struct constraint_clause {
  constraint_op op;
  version target;

  bool satisfied_by(version const &v) const;
  std::string to_string() const;
};

// AND-list of clauses, e.g. ">= 1.2, < 2". Empty means any version.
class constraint {
 public:
  constraint() = default;

  static constraint parse(std::string_view text);  // throws parse_error
  static constraint any() { return {}; }

  bool satisfied_by(version const &v) const;
  bool is_any() const { return clauses_.empty(); }

  // True when a clause targets a development or pre-release version, which opts that
  // kind of version into best_match.
  bool names_prerelease() const;

  std::vector<constraint_clause> const &clauses() const { return clauses_; }
  std::string to_string() const;

 private:
  std::vector<constraint_clause> clauses_;
};

struct match_options {
  bool allow_prerelease{ false };
};

// Highest candidate satisfying `c`; ties on modrev go to the highest specrev.
std::optional<version> best_match(constraint const &c,
                                  std::vector<version> const &candidates,
                                  match_options const &opts = {});

// "name op ver, op ver". The name is lower-cased; "lua" is the runtime itself.
struct dependency {
  std::string name;
  constraint version_constraint;

  static dependency parse(std::string_view text);  // throws parse_error

  bool is_runtime() const { return name == "lua"; }
  std::string to_string() const;
};

}  // namespace quarry
