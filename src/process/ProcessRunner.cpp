#include "board-ident/process/ProcessRunner.hpp"
#include "board-ident/Logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace boardident {
namespace process {

namespace {

int wait_child(pid_t pid) {
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR)
      return -1;
  }
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

} // namespace

std::optional<ProcessResult>
ProcessRunner::run(const std::vector<std::string> &args,
                   std::chrono::milliseconds timeout) {
  if (args.empty())
    return std::nullopt;

  const std::string &tool = args.front();

  std::vector<char *> argv;
  for (const auto &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  int pipe_fds[2];
  if (pipe(pipe_fds) != 0) {
    LOG_ERROR("PROCESS", tool, "pipe failed: {}", strerror(errno));
    return std::nullopt;
  }

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addclose(&actions, pipe_fds[0]);
  posix_spawn_file_actions_adddup2(&actions, pipe_fds[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, pipe_fds[1], STDERR_FILENO);
  posix_spawn_file_actions_addclose(&actions, pipe_fds[1]);
  posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null",
                                   O_RDONLY, 0);

  pid_t pid;
  int status =
      posix_spawnp(&pid, argv[0], &actions, nullptr, argv.data(), environ);
  posix_spawn_file_actions_destroy(&actions);
  close(pipe_fds[1]);

  if (status != 0) {
    LOG_WARN("PROCESS", tool, "posix_spawn failed: {}", strerror(status));
    close(pipe_fds[0]);
    return std::nullopt;
  }

  LOG_DEBUG("PROCESS", tool, "Spawned PID={} ({} args)", pid, args.size());

  ProcessResult result;
  auto deadline = std::chrono::steady_clock::now() + timeout;
  char buffer[512];

  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      result.timed_out = true;
      break;
    }

    pollfd pfd{pipe_fds[0], POLLIN, 0};
    int rc = poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      LOG_ERROR("PROCESS", tool, "poll failed: {}", strerror(errno));
      break;
    }
    if (rc == 0)
      continue;

    ssize_t n = ::read(pipe_fds[0], buffer, sizeof(buffer));
    if (n < 0 && errno == EINTR)
      continue;
    if (n <= 0)
      break; // EOF: child closed its end
    result.output.append(buffer, static_cast<size_t>(n));
  }

  close(pipe_fds[0]);

  if (result.timed_out) {
    LOG_WARN("PROCESS", tool, "Timed out after {}ms, killing PID={}",
             timeout.count(), pid);
    kill(pid, SIGKILL);
  }

  result.exit_code = wait_child(pid);
  LOG_DEBUG("PROCESS", tool, "Exited with code {}", result.exit_code);
  return result;
}

} // namespace process
} // namespace boardident
