#include "errors.h"

namespace quarry {

std::string_view error_kind_name(error_kind kind) {
  switch (kind) {
    case error_kind::parse: return "parse error";
    case error_kind::not_found: return "not found";
    case error_kind::network: return "network error";
    case error_kind::malformed_index: return "malformed index";
    case error_kind::constraint_conflict: return "constraint conflict";
    case error_kind::cyclic_dependency: return "cyclic dependency";
    case error_kind::did_not_converge: return "resolution did not converge";
    case error_kind::build: return "build error";
    case error_kind::integrity_violation: return "integrity violation";
    case error_kind::cancelled: return "cancelled";
    case error_kind::dependency_failed: return "dependency failed";
  }
  return "unknown";
}

std::string_view build_error_kind_name(build_error_kind kind) {
  switch (kind) {
    case build_error_kind::missing_file: return "missing file";
    case build_error_kind::header_not_found: return "header not found";
    case build_error_kind::external_dependency_not_found:
      return "external dependency not found";
    case build_error_kind::compile_error: return "compile error";
    case build_error_kind::tool_not_found: return "tool not found";
    case build_error_kind::tool_exit_nonzero: return "tool exited nonzero";
    case build_error_kind::script_error: return "script error";
    case build_error_kind::script_timeout: return "script timeout";
    case build_error_kind::unsupported_build_type: return "unsupported build type";
  }
  return "unknown";
}

parse_error::parse_error(std::string reason, std::size_t offset, std::string_view input)
    : error(error_kind::parse,
            input.empty() ? reason + " (at offset " + std::to_string(offset) + ")"
                          : reason + " at offset " + std::to_string(offset) + " in '" +
                                std::string{ input } + "'"),
      reason_{ std::move(reason) },
      offset_{ offset } {}

namespace {

std::string format_conflict(std::string const &name,
                            std::vector<std::string> const &constraints) {
  std::string msg{ "no version of '" + name + "' satisfies all constraints:" };
  for (auto const &c : constraints) { msg += "\n  " + c; }
  return msg;
}

std::string format_cycle(std::vector<std::string> const &cycle) {
  std::string path;
  for (auto const &n : cycle) {
    if (!path.empty()) { path += " -> "; }
    path += n;
  }
  return "dependency cycle detected: " + path;
}

}  // namespace

constraint_conflict::constraint_conflict(std::string name,
                                         std::vector<std::string> constraints)
    : error(error_kind::constraint_conflict, format_conflict(name, constraints)),
      name_{ std::move(name) },
      constraints_{ std::move(constraints) } {}

cyclic_dependency::cyclic_dependency(std::vector<std::string> cycle)
    : error(error_kind::cyclic_dependency, format_cycle(cycle)),
      cycle_{ std::move(cycle) } {}

}  // namespace quarry
