#include "skyhost/process/runner.hpp"

#include "skyhost/common/fs.hpp"
#include "skyhost/observability/global.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace skyhost::process {

namespace {

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void close_pipe(int (&fds)[2]) {
  for (int &fd : fds) {
    if (fd >= 0) {
      close(fd);
      fd = -1;
    }
  }
}

// Drains whatever is available without blocking; mirrors the new bytes when asked.
void drain(const int fd, std::string &buffer, std::ostream *mirror) {
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes <= 0) {
      return;
    }
    buffer.append(chunk.data(), static_cast<std::size_t>(bytes));
    if (mirror != nullptr) {
      mirror->write(chunk.data(), bytes);
      mirror->flush();
    }
  }
}

std::vector<std::string> build_environment(const std::map<std::string, std::string> &overrides) {
  std::vector<std::string> entries;
  for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    const std::string line(*entry);
    const auto equals = line.find('=');
    const std::string key = equals == std::string::npos ? line : line.substr(0, equals);
    if (!overrides.contains(key)) {
      entries.push_back(line);
    }
  }
  for (const auto &[key, value] : overrides) {
    entries.push_back(key + "=" + value);
  }
  return entries;
}

std::vector<char *> to_c_array(std::vector<std::string> &values) {
  std::vector<char *> out;
  out.reserve(values.size() + 1);
  for (auto &value : values) {
    out.push_back(value.data());
  }
  out.push_back(nullptr);
  return out;
}

} // namespace

common::Result<ProcessResult> SubprocessRunner::run(const std::vector<std::string> &argv,
                                                    const CommandOptions &options) {
  if (argv.empty() || argv.front().empty()) {
    return common::Result<ProcessResult>::failure(common::ErrorKind::Io, "command is empty");
  }

  const std::string command_line = common::join(argv, " ");
  // Everything the child needs is built before fork.
  std::vector<std::string> args_storage = argv;
  std::vector<std::string> env_storage = build_environment(options.env);
  std::vector<char *> child_argv = to_c_array(args_storage);
  std::vector<char *> child_envp = to_c_array(env_storage);

  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);
    return common::Result<ProcessResult>::failure(common::ErrorKind::Io,
                                                  "failed to create pipes for " + argv.front());
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);
    return common::Result<ProcessResult>::failure(common::ErrorKind::Io,
                                                  "failed to fork " + argv.front());
  }

  if (pid == 0) {
    (void)dup2(stdout_pipe[1], STDOUT_FILENO);
    (void)dup2(stderr_pipe[1], STDERR_FILENO);
    close(stdout_pipe[0]);
    close(stdout_pipe[1]);
    close(stderr_pipe[0]);
    close(stderr_pipe[1]);

    execvpe(child_argv[0], child_argv.data(), child_envp.data());

    const char *reason = std::strerror(errno);
    (void)!write(STDERR_FILENO, child_argv[0], std::strlen(child_argv[0]));
    (void)!write(STDERR_FILENO, ": ", 2);
    (void)!write(STDERR_FILENO, reason, std::strlen(reason));
    (void)!write(STDERR_FILENO, "\n", 1);
    _exit(kExitCommandNotFound);
  }

  close(stdout_pipe[1]);
  close(stderr_pipe[1]);
  set_non_blocking(stdout_pipe[0]);
  set_non_blocking(stderr_pipe[0]);

  std::ostream *out_mirror = options.echo_output ? &std::cout : nullptr;
  std::ostream *err_mirror = options.echo_output ? &std::cerr : nullptr;

  ProcessResult result;
  int status = 0;
  const auto started = std::chrono::steady_clock::now();

  while (true) {
    drain(stdout_pipe[0], result.stdout_text, out_mirror);
    drain(stderr_pipe[0], result.stderr_text, err_mirror);

    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }

    if (options.timeout.has_value() &&
        std::chrono::steady_clock::now() - started > *options.timeout) {
      result.timed_out = true;
      (void)kill(pid, SIGKILL);
      (void)waitpid(pid, &status, 0);
      break;
    }

    struct pollfd poll_fds[2] = {
        {.fd = stdout_pipe[0], .events = POLLIN, .revents = 0},
        {.fd = stderr_pipe[0], .events = POLLIN, .revents = 0},
    };
    (void)poll(poll_fds, 2, 50);
  }

  drain(stdout_pipe[0], result.stdout_text, out_mirror);
  drain(stderr_pipe[0], result.stderr_text, err_mirror);
  close(stdout_pipe[0]);
  close(stderr_pipe[0]);

  result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  if (result.timed_out) {
    result.exit_code = -1;
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_tool_invocation(command_line, result.exit_code, elapsed,
                                        result.timed_out);

  if (result.timed_out && !options.allow_failure) {
    return common::Result<ProcessResult>::failure(
        common::ErrorKind::Io,
        "command timed out after " + std::to_string(options.timeout->count()) +
            "ms: " + command_line);
  }

  if (result.exit_code != 0 && !options.allow_failure) {
    const std::string diagnostic = common::trim(result.stderr_text);
    return common::Result<ProcessResult>::failure(
        common::ErrorKind::Io, diagnostic.empty()
                                   ? "command failed with exit code " +
                                         std::to_string(result.exit_code) + ": " + command_line
                                   : diagnostic);
  }

  return common::Result<ProcessResult>::success(std::move(result));
}

} // namespace skyhost::process
