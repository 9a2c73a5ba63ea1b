#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace quarry {

using shell_env_t = std::unordered_map<std::string, std::string>;

struct shell_result {
  int exit_code;
  std::optional<int> signal;
  bool cancelled{ false };
};

enum class shell_stream { std_out, std_err };

struct shell_run_cfg {
  std::function<void(std::string_view)> on_stdout_line;
  std::function<void(std::string_view)> on_stderr_line;
  std::function<void(std::string_view)> on_output_line;  // both streams, interleaved
  std::optional<std::filesystem::path> cwd;
  std::optional<shell_env_t> env;  // nullopt inherits the current environment
  std::atomic_bool const *cancel{ nullptr };  // when set, the child's process group is killed
};

shell_env_t shell_getenv();

// Runs `script` with /bin/sh from a temporary file.
shell_result shell_run(std::string_view script, shell_run_cfg const &cfg);

// Runs argv directly. argv[0] is looked up on PATH; throws std::system_error when it is
// not found.
shell_result shell_exec(std::vector<std::string> const &argv, shell_run_cfg const &cfg);

// Quotes `arg` for inclusion in a /bin/sh command line.
std::string shell_quote(std::string_view arg);

}  // namespace quarry
