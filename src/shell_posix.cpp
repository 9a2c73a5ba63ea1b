#include "shell.h"

#include "platform.h"
#include "util.h"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace quarry {
namespace {

constexpr int kChildErrorExit{ 127 };
constexpr int kSignalExitBase{ 128 };
constexpr int kCancelPollMs{ 100 };

class fd_cleanup {
 public:
  explicit fd_cleanup(int fd) : fd_{ fd } {}
  ~fd_cleanup() {
    if (fd_ != -1) { close_with_retry(); }
  }

  fd_cleanup(fd_cleanup const &) = delete;
  fd_cleanup &operator=(fd_cleanup const &) = delete;
  fd_cleanup(fd_cleanup &&other) noexcept : fd_{ other.fd_ } { other.fd_ = -1; }

  int get() const { return fd_; }

  void release() {
    if (fd_ == -1) { return; }
    close_with_retry();
    fd_ = -1;
  }

 private:
  void close_with_retry() {
    for (int attempts{ 0 }; attempts < 3 && ::close(fd_) == -1; ++attempts) {
      if (errno != EINTR) { break; }
    }
  }

  int fd_{ -1 };
};

void write_all(int fd, char const *data, size_t size) {
  while (size > 0) {
    ssize_t const written{ ::write(fd, data, size) };
    if (written == -1) {
      if (errno == EINTR) { continue; }
      throw std::system_error(errno, std::generic_category(), "write failed");
    }
    size -= static_cast<size_t>(written);
    data += written;
  }
}

std::filesystem::path create_temp_script(std::string_view script) {
  auto const tmp_dir{ std::filesystem::temp_directory_path() };
  std::string const pattern{ (tmp_dir / "quarry-shell-XXXXXX").string() };

  std::vector<char> path_buffer{ pattern.begin(), pattern.end() };
  path_buffer.push_back('\0');

  int const fd{ ::mkstemp(path_buffer.data()) };
  if (fd == -1) {
    throw std::system_error(errno, std::generic_category(), "mkstemp failed");
  }
  fd_cleanup fd_guard{ fd };

  std::string content{ script };
  if (!content.empty() && content.back() != '\n') { content.push_back('\n'); }
  write_all(fd_guard.get(), content.data(), content.size());

  if (::fchmod(fd_guard.get(), S_IRUSR | S_IWUSR | S_IXUSR) == -1) {
    throw std::system_error(errno, std::generic_category(), "fchmod failed");
  }

  return std::filesystem::path{ path_buffer.data() };
}

struct pipe_state {
  fd_cleanup read_fd;
  shell_stream stream;
  std::string pending;
  bool closed;
};

void emit_line(pipe_state const &pipe, std::string_view line, shell_run_cfg const &cfg) {
  auto const &per_stream{ pipe.stream == shell_stream::std_out ? cfg.on_stdout_line
                                                              : cfg.on_stderr_line };
  if (per_stream) { per_stream(line); }
  if (cfg.on_output_line) { cfg.on_output_line(line); }
}

bool cancel_requested(shell_run_cfg const &cfg) {
  return cfg.cancel && cfg.cancel->load();
}

// Returns true if the child was killed because of cancellation.
bool stream_pipes(std::array<pipe_state, 2> &pipes, pid_t child, shell_run_cfg const &cfg) {
  std::array<pollfd, 2> poll_fds{};
  std::string chunk(4096, '\0');
  size_t closed_count{ 0 };
  bool killed{ false };

  for (size_t i{ 0 }; i < pipes.size(); ++i) {
    poll_fds[i].fd = pipes[i].read_fd.get();
    poll_fds[i].events = POLLIN;
  }

  while (closed_count < pipes.size()) {
    if (!killed && cancel_requested(cfg)) {
      ::kill(-child, SIGKILL);
      killed = true;
    }

    int const poll_result{
      ::poll(poll_fds.data(), poll_fds.size(), cfg.cancel ? kCancelPollMs : -1)
    };
    if (poll_result == -1) {
      if (errno == EINTR) { continue; }
      throw std::system_error(errno, std::generic_category(), "poll failed");
    }
    if (poll_result == 0) { continue; }

    for (size_t i{ 0 }; i < pipes.size(); ++i) {
      auto &pipe{ pipes[i] };
      if (pipe.closed || poll_fds[i].revents == 0) { continue; }
      if (poll_fds[i].revents & POLLNVAL) {
        throw std::runtime_error("poll failed on child pipe");
      }

      ssize_t const read_bytes{ ::read(pipe.read_fd.get(), chunk.data(), chunk.size()) };
      if (read_bytes == -1) {
        if (errno == EINTR) { continue; }
        throw std::system_error(errno, std::generic_category(), "read failed");
      }

      if (read_bytes == 0) {
        if (!pipe.pending.empty()) {
          emit_line(pipe, pipe.pending, cfg);
          pipe.pending.clear();
        }
        pipe.closed = true;
        ++closed_count;
        poll_fds[i].fd = -1;
        poll_fds[i].events = 0;
        continue;
      }

      pipe.pending.append(chunk.data(), static_cast<size_t>(read_bytes));

      size_t newline{ 0 };
      while ((newline = pipe.pending.find('\n')) != std::string::npos) {
        emit_line(pipe, std::string_view{ pipe.pending }.substr(0, newline), cfg);
        pipe.pending.erase(0, newline + 1);
      }
    }
  }

  return killed;
}

shell_result wait_for_child(pid_t child) {
  int status{ 0 };
  while (true) {
    pid_t const result{ ::waitpid(child, &status, 0) };
    if (result == -1 && errno == EINTR) { continue; }
    if (result == -1) {
      throw std::system_error(errno, std::generic_category(), "waitpid failed");
    }
    break;
  }

  if (WIFEXITED(status)) {
    return { .exit_code = WEXITSTATUS(status), .signal = std::nullopt };
  }

  if (WIFSIGNALED(status)) {
    int const sig{ WTERMSIG(status) };
    return { .exit_code = kSignalExitBase + sig, .signal = sig };
  }

  return { .exit_code = status, .signal = std::nullopt };
}

[[noreturn]] void exec_child_process(fd_cleanup &stdout_read,
                                     fd_cleanup &stdout_write,
                                     fd_cleanup &stderr_read,
                                     fd_cleanup &stderr_write,
                                     std::optional<std::filesystem::path> const &cwd,
                                     std::vector<std::string> const &argv_strings,
                                     char **envp) {
  ::setpgid(0, 0);  // own process group so cancellation reaches grandchildren

  stdout_read.release();
  stderr_read.release();

  int const null_fd{ ::open("/dev/null", O_RDONLY) };
  if (null_fd == -1) {
    std::perror("open /dev/null");
    _exit(kChildErrorExit);
  }

  std::array<std::pair<int, int>, 3> const fd_mappings{
    std::pair{ null_fd, STDIN_FILENO },
    std::pair{ stdout_write.get(), STDOUT_FILENO },
    std::pair{ stderr_write.get(), STDERR_FILENO },
  };

  for (auto const &[src, dst] : fd_mappings) {
    if (::dup2(src, dst) == -1) {
      std::perror("dup2");
      _exit(kChildErrorExit);
    }
  }

  if (null_fd != STDIN_FILENO) { ::close(null_fd); }
  stdout_write.release();
  stderr_write.release();

  if (cwd && ::chdir(cwd->c_str()) == -1) {
    std::perror("chdir");
    _exit(kChildErrorExit);
  }

  std::vector<char *> argv;
  argv.reserve(argv_strings.size() + 1);
  for (auto const &arg : argv_strings) { argv.push_back(const_cast<char *>(arg.c_str())); }
  argv.push_back(nullptr);

  ::execve(argv_strings[0].c_str(), argv.data(), envp);
  std::perror("execve");
  _exit(kChildErrorExit);
}

shell_result spawn(std::vector<std::string> const &argv_strings, shell_run_cfg const &cfg) {
  if (argv_strings.empty()) { throw std::invalid_argument("shell: argv must be non-empty"); }

  std::vector<std::string> env_strings;
  std::vector<char *> envp;
  if (cfg.env) {
    env_strings.reserve(cfg.env->size());
    for (auto const &[key, value] : *cfg.env) { env_strings.push_back(key + "=" + value); }
    for (auto &entry : env_strings) { envp.push_back(entry.data()); }
    envp.push_back(nullptr);
  }

  int stdout_pipefd[2];
  if (::pipe(stdout_pipefd) == -1) {
    throw std::system_error(errno, std::generic_category(), "pipe failed");
  }
  fd_cleanup stdout_read_end{ stdout_pipefd[0] };
  fd_cleanup stdout_write_end{ stdout_pipefd[1] };

  int stderr_pipefd[2];
  if (::pipe(stderr_pipefd) == -1) {
    throw std::system_error(errno, std::generic_category(), "pipe failed");
  }
  fd_cleanup stderr_read_end{ stderr_pipefd[0] };
  fd_cleanup stderr_write_end{ stderr_pipefd[1] };

  pid_t const child{ ::fork() };
  if (child == -1) {
    throw std::system_error(errno, std::generic_category(), "fork failed");
  }

  if (child == 0) {
    exec_child_process(stdout_read_end,
                       stdout_write_end,
                       stderr_read_end,
                       stderr_write_end,
                       cfg.cwd,
                       argv_strings,
                       cfg.env ? envp.data() : environ);
  }

  ::setpgid(child, child);  // also set from the parent to close the race with kill()

  stdout_write_end.release();
  stderr_write_end.release();

  shell_result result{};
  try {
    std::array<pipe_state, 2> pipes{
      pipe_state{ std::move(stdout_read_end), shell_stream::std_out, {}, false },
      pipe_state{ std::move(stderr_read_end), shell_stream::std_err, {}, false },
    };

    bool const killed{ stream_pipes(pipes, child, cfg) };
    result = wait_for_child(child);
    result.cancelled = killed;
  } catch (...) {
    ::kill(-child, SIGKILL);
    wait_for_child(child);
    throw;
  }

  return result;
}

}  // namespace

shell_env_t shell_getenv() {
  shell_env_t env;
  if (!environ) { return env; }

  for (char **entry{ environ }; *entry != nullptr; ++entry) {
    std::string_view const kv{ *entry };
    size_t const sep{ kv.find('=') };
    if (sep == std::string_view::npos) { continue; }
    env[std::string{ kv.substr(0, sep) }] = std::string{ kv.substr(sep + 1) };
  }

  return env;
}

shell_result shell_run(std::string_view script, shell_run_cfg const &cfg) {
  auto const script_path{ create_temp_script(script) };
  scoped_path_cleanup const cleanup{ script_path };
  return spawn({ "/bin/sh", script_path.string() }, cfg);
}

shell_result shell_exec(std::vector<std::string> const &argv, shell_run_cfg const &cfg) {
  if (argv.empty()) { throw std::invalid_argument("shell_exec: argv must be non-empty"); }

  auto const exe{ platform::find_executable(argv[0]) };
  if (!exe) {
    throw std::system_error(ENOENT, std::generic_category(), "not found: " + argv[0]);
  }

  auto resolved{ argv };
  resolved[0] = exe->string();
  return spawn(resolved, cfg);
}

std::string shell_quote(std::string_view arg) {
  std::string out{ "'" };
  for (char const c : arg) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out += c;
    }
  }
  out += '\'';
  return out;
}

}  // namespace quarry
