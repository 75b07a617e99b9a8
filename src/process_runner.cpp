/**
 * @file process_runner.cpp
 * @brief posix_spawn based process execution
 *
 * @details Child stdout and stderr are redirected into one pipe. The parent
 *          polls the pipe in POLL_INTERVAL_MS slices, which bounds how late
 *          a timeout or cancellation is noticed.
 */

#include "region_redact/process_runner.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "region_redact/logging.hpp"

extern char **environ;

namespace region_redact {

namespace {

constexpr int POLL_INTERVAL_MS = 100;

/// Time a terminated child gets before SIGKILL
constexpr auto KILL_GRACE = std::chrono::seconds(2);

/// Read whatever is available; returns false once the pipe hit EOF
bool drain_pipe(int fd, std::string &out, size_t max_output) {
  char buf[4096];
  while (true) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      size_t room = max_output > out.size() ? max_output - out.size() : 0;
      out.append(buf, std::min(static_cast<size_t>(n), room));
      continue;
    }
    if (n == 0)
      return false;
    if (errno == EINTR)
      continue;
    /// EAGAIN: nothing more right now
    return true;
  }
}

int decode_status(int status) {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

/// SIGTERM, wait up to KILL_GRACE, then SIGKILL. Returns the wait status.
int terminate_child(pid_t pid) {
  ::kill(pid, SIGTERM);
  auto deadline = std::chrono::steady_clock::now() + KILL_GRACE;
  int status = 0;
  while (std::chrono::steady_clock::now() < deadline) {
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid)
      return status;
    std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
  }
  ::kill(pid, SIGKILL);
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
  return status;
}

} // anonymous namespace

std::string format_command(const std::vector<std::string> &argv) {
  std::string cmd;
  for (size_t i = 0; i < argv.size(); ++i) {
    if (i > 0)
      cmd += ' ';
    if (argv[i].find_first_of(" \t\"'") != std::string::npos) {
      cmd += fmt::format("\"{}\"", argv[i]);
    } else {
      cmd += argv[i];
    }
  }
  return cmd;
}

ProcessResult run_process(const std::vector<std::string> &argv,
                          const ProcessOptions &options) {
  ProcessResult result;
  if (argv.empty()) {
    result.spawn_failed = true;
    result.output = "empty command";
    return result;
  }

  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    result.spawn_failed = true;
    result.output = fmt::format("pipe2 failed: {}", std::strerror(errno));
    return result;
  }

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_adddup2(&actions, fds[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, fds[1], STDERR_FILENO);

  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto &a : argv)
    args.push_back(const_cast<char *>(a.c_str()));
  args.push_back(nullptr);

  pid_t pid = 0;
  int rc = options.search_path
               ? posix_spawnp(&pid, args[0], &actions, nullptr, args.data(),
                              environ)
               : posix_spawn(&pid, args[0], &actions, nullptr, args.data(),
                             environ);
  posix_spawn_file_actions_destroy(&actions);
  ::close(fds[1]);

  if (rc != 0) {
    ::close(fds[0]);
    result.spawn_failed = true;
    result.output =
        fmt::format("cannot start {}: {}", argv[0], std::strerror(rc));
    return result;
  }

  int flags = ::fcntl(fds[0], F_GETFL);
  ::fcntl(fds[0], F_SETFL, flags | O_NONBLOCK);

  auto start = std::chrono::steady_clock::now();
  bool pipe_open = true;
  int status = 0;

  while (true) {
    if (pipe_open) {
      pollfd pfd{fds[0], POLLIN, 0};
      int pr = ::poll(&pfd, 1, POLL_INTERVAL_MS);
      if (pr > 0)
        pipe_open = drain_pipe(fds[0], result.output, options.max_output);
    } else {
      std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
    }

    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid) {
      result.exit_code = decode_status(status);
      break;
    }
    if (r < 0 && errno != EINTR) {
      result.output += fmt::format("\nwaitpid failed: {}", std::strerror(errno));
      break;
    }

    if (options.cancel && options.cancel->load()) {
      result.cancelled = true;
      result.exit_code = decode_status(terminate_child(pid));
      break;
    }

    if (options.timeout.count() > 0 &&
        std::chrono::steady_clock::now() - start >= options.timeout) {
      result.timed_out = true;
      result.exit_code = decode_status(terminate_child(pid));
      break;
    }
  }

  /// Collect the tail written right before exit
  if (pipe_open)
    drain_pipe(fds[0], result.output, options.max_output);
  ::close(fds[0]);

  if (result.timed_out) {
    LOG_WARN("{} timed out after {}s", argv[0], options.timeout.count());
  } else if (result.cancelled) {
    LOG_WARN("{} cancelled", argv[0]);
  }

  return result;
}

} // namespace region_redact
