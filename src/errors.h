#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace quarry {

enum class error_kind {
  parse,
  not_found,
  network,
  malformed_index,
  constraint_conflict,
  cyclic_dependency,
  did_not_converge,
  build,
  integrity_violation,
  cancelled,
  dependency_failed,
};

std::string_view error_kind_name(error_kind kind);

class error : public std::runtime_error {
 public:
  error(error_kind kind, std::string const &message)
      : std::runtime_error(message), kind_{ kind } {}

  error_kind kind() const { return kind_; }

 private:
  error_kind kind_;
};

class parse_error : public error {
 public:
  parse_error(std::string reason, std::size_t offset, std::string_view input = {});

  std::string const &reason() const { return reason_; }
  std::size_t offset() const { return offset_; }

 private:
  std::string reason_;
  std::size_t offset_;
};

class not_found : public error {
 public:
  explicit not_found(std::string const &what)
      : error(error_kind::not_found, what + " not found") {}
};

class network_error : public error {
 public:
  network_error(std::string const &message, bool retryable)
      : error(error_kind::network, message), retryable_{ retryable } {}

  bool retryable() const { return retryable_; }

 private:
  bool retryable_;
};

class malformed_index : public error {
 public:
  explicit malformed_index(std::string const &message)
      : error(error_kind::malformed_index, "malformed index: " + message) {}
};

class constraint_conflict : public error {
 public:
  constraint_conflict(std::string name, std::vector<std::string> constraints);

  std::string const &name() const { return name_; }
  std::vector<std::string> const &constraints() const { return constraints_; }

 private:
  std::string name_;
  std::vector<std::string> constraints_;
};

class cyclic_dependency : public error {
 public:
  explicit cyclic_dependency(std::vector<std::string> cycle);

  std::vector<std::string> const &cycle() const { return cycle_; }

 private:
  std::vector<std::string> cycle_;
};

class resolution_did_not_converge : public error {
 public:
  resolution_did_not_converge(std::string name, int attempts)
      : error(error_kind::did_not_converge,
              "resolution did not converge for '" + name + "' after " +
                  std::to_string(attempts) + " re-resolutions"),
        name_{ std::move(name) } {}

  std::string const &name() const { return name_; }

 private:
  std::string name_;
};

class integrity_violation : public error {
 public:
  integrity_violation(std::string subject, std::string expected, std::string actual)
      : error(error_kind::integrity_violation,
              "integrity mismatch for " + subject + ": expected " + expected + ", got " +
                  actual),
        subject_{ std::move(subject) },
        expected_{ std::move(expected) },
        actual_{ std::move(actual) } {}

  std::string const &subject() const { return subject_; }
  std::string const &expected() const { return expected_; }
  std::string const &actual() const { return actual_; }

 private:
  std::string subject_;
  std::string expected_;
  std::string actual_;
};

class cancelled : public error {
 public:
  cancelled() : error(error_kind::cancelled, "cancelled") {}
};

class dependency_failed : public error {
 public:
  explicit dependency_failed(std::string dependency)
      : error(error_kind::dependency_failed, "dependency '" + dependency + "' failed"),
        dependency_{ std::move(dependency) } {}

  std::string const &dependency() const { return dependency_; }

 private:
  std::string dependency_;
};

// Build failures. Node-local: they fail one package and its dependents.
enum class build_error_kind {
  missing_file,
  header_not_found,
  external_dependency_not_found,
  compile_error,
  tool_not_found,
  tool_exit_nonzero,
  script_error,
  script_timeout,
  unsupported_build_type,
};

std::string_view build_error_kind_name(build_error_kind kind);

class build_error : public error {
 public:
  build_error(build_error_kind kind, std::string const &message)
      : error(error_kind::build, message), build_kind_{ kind } {}

  build_error_kind build_kind() const { return build_kind_; }

 private:
  build_error_kind build_kind_;
};

class missing_file : public build_error {
 public:
  explicit missing_file(std::string const &path)
      : build_error(build_error_kind::missing_file, "missing file: " + path) {}
};

class header_not_found : public build_error {
 public:
  explicit header_not_found(std::string const &detail)
      : build_error(build_error_kind::header_not_found,
                    "Lua headers not found: " + detail) {}
};

class external_dependency_not_found : public build_error {
 public:
  explicit external_dependency_not_found(std::string name)
      : build_error(build_error_kind::external_dependency_not_found,
                    "external dependency not found: " + name),
        name_{ std::move(name) } {}

  std::string const &name() const { return name_; }

 private:
  std::string name_;
};

class compile_error : public build_error {
 public:
  explicit compile_error(std::string output)
      : build_error(build_error_kind::compile_error, "compilation failed:\n" + output),
        output_{ std::move(output) } {}

  std::string const &output() const { return output_; }

 private:
  std::string output_;
};

class tool_not_found : public build_error {
 public:
  explicit tool_not_found(std::string const &tool)
      : build_error(build_error_kind::tool_not_found, "build tool not found: " + tool) {}
};

class tool_exit_nonzero : public build_error {
 public:
  tool_exit_nonzero(std::string const &tool, int code, std::string output)
      : build_error(build_error_kind::tool_exit_nonzero,
                    tool + " exited with code " + std::to_string(code) +
                        (output.empty() ? "" : ":\n" + output)),
        code_{ code },
        output_{ std::move(output) } {}

  int code() const { return code_; }
  std::string const &output() const { return output_; }

 private:
  int code_;
  std::string output_;
};

class script_error : public build_error {
 public:
  explicit script_error(std::string const &message)
      : build_error(build_error_kind::script_error, "build script failed: " + message) {}
};

class script_timeout : public build_error {
 public:
  explicit script_timeout(long long timeout_ms)
      : build_error(build_error_kind::script_timeout,
                    "build script exceeded " + std::to_string(timeout_ms) + "ms") {}
};

class unsupported_build_type : public build_error {
 public:
  explicit unsupported_build_type(std::string const &tag)
      : build_error(build_error_kind::unsupported_build_type,
                    "unsupported build type '" + tag + "'") {}
};

}  // namespace quarry
