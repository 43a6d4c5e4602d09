/**
 * @file process_runner.cpp
 * @brief Child process execution implementation
 *
 * @details A CLOEXEC status pipe reports exec failures back to the parent:
 *          if execvp succeeds the pipe simply closes, otherwise the child
 *          writes errno into it before _exit(127).
 */

#include "scene_cut/process_runner.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "scene_cut/logging.hpp"

namespace scene_cut {

namespace {

/// Close a descriptor if open and mark it closed
void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

/// Read whatever is available; closes fd on EOF or error
void drain_fd(int &fd, std::string &sink) {
  char buf[4096];
  ssize_t n = read(fd, buf, sizeof(buf));
  if (n > 0) {
    sink.append(buf, static_cast<size_t>(n));
  } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
    close_fd(fd);
  }
}

} // anonymous namespace

ProcessResult run_process(const std::vector<std::string> &argv,
                          double timeout_sec) {
  ProcessResult result;
  if (argv.empty()) {
    result.err = "empty command";
    return result;
  }

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};
  if (pipe2(out_pipe, O_CLOEXEC) == -1 || pipe2(err_pipe, O_CLOEXEC) == -1 ||
      pipe2(status_pipe, O_CLOEXEC) == -1) {
    result.err = fmt::format("pipe failed: {}", std::strerror(errno));
    for (int *p : {out_pipe, err_pipe, status_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
    return result;
  }

  /// Build argv before forking; only async-signal-safe calls after fork
  std::vector<char *> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto &arg : argv)
    c_argv.push_back(const_cast<char *>(arg.c_str()));
  c_argv.push_back(nullptr);

  pid_t pid = fork();
  if (pid == -1) {
    result.err = fmt::format("fork failed: {}", std::strerror(errno));
    for (int *p : {out_pipe, err_pipe, status_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
    return result;
  }

  if (pid == 0) {
    // **---- CHILD ----**
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0)
      dup2(devnull, STDIN_FILENO);
    execvp(c_argv[0], c_argv.data());
    int exec_errno = errno;
    ssize_t ignored = write(status_pipe[1], &exec_errno, sizeof(exec_errno));
    (void)ignored;
    _exit(127);
  }

  // **---- PARENT ----**

  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(status_pipe[1]);

  /// Blocks until exec succeeds (pipe closes) or fails (errno written)
  int exec_errno = 0;
  ssize_t n;
  do {
    n = read(status_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n == -1 && errno == EINTR);
  close_fd(status_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    waitpid(pid, nullptr, 0);
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);
    result.err = fmt::format("cannot execute '{}': {}", argv[0],
                             std::strerror(exec_errno));
    return result;
  }
  result.spawned = true;

  using clock = std::chrono::steady_clock;
  const bool bounded = timeout_sec > 0;
  const auto deadline =
      clock::now() + std::chrono::milliseconds(
                         static_cast<long long>(timeout_sec * 1000.0));

  int out_fd = out_pipe[0];
  int err_fd = err_pipe[0];

  while (out_fd >= 0 || err_fd >= 0) {
    int wait_ms = -1;
    if (bounded) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                      deadline - clock::now())
                      .count();
      if (left <= 0) {
        result.timed_out = true;
        break;
      }
      wait_ms = static_cast<int>(left);
    }

    pollfd fds[2];
    nfds_t nfds = 0;
    if (out_fd >= 0)
      fds[nfds++] = {out_fd, POLLIN, 0};
    if (err_fd >= 0)
      fds[nfds++] = {err_fd, POLLIN, 0};

    int ready = poll(fds, nfds, wait_ms);
    if (ready == -1) {
      if (errno == EINTR)
        continue;
      LOG_WARN("poll failed while reading child output: {}",
               std::strerror(errno));
      break;
    }
    if (ready == 0)
      continue; //< Deadline re-checked at the top of the loop

    for (nfds_t i = 0; i < nfds; ++i) {
      if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
        continue;
      if (fds[i].fd == out_fd)
        drain_fd(out_fd, result.out);
      else if (fds[i].fd == err_fd)
        drain_fd(err_fd, result.err);
    }
  }

  close_fd(out_fd);
  close_fd(err_fd);

  /// Pipes closed; the child may still be running until the deadline
  int status = 0;
  while (!result.timed_out) {
    pid_t w = waitpid(pid, &status, bounded ? WNOHANG : 0);
    if (w == pid)
      break;
    if (w == -1 && errno != EINTR) {
      result.err += fmt::format("\nwaitpid failed: {}", std::strerror(errno));
      return result;
    }
    if (bounded && clock::now() >= deadline) {
      result.timed_out = true;
      break;
    }
    if (bounded)
      usleep(10 * 1000);
  }

  if (result.timed_out) {
    kill(pid, SIGKILL);
    while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
  }
  return result;
}

std::string describe(const ProcessResult &result) {
  if (!result.spawned)
    return fmt::format("spawn failed ({})", result.err);
  if (result.timed_out)
    return "timed out";
  if (result.term_signal != 0)
    return fmt::format("killed by signal {}", result.term_signal);
  return fmt::format("exit code {}", result.exit_code);
}

} // namespace scene_cut
