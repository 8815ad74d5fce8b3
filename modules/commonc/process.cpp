#include <flotilla/common/log.h>
#include <flotilla/util/process.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace flot::util {
namespace {
struct FileActions {
  FileActions() { posix_spawn_file_actions_init(&actions); }
  ~FileActions() { posix_spawn_file_actions_destroy(&actions); }
  posix_spawn_file_actions_t actions;
};

std::vector<char*>
MakeArgv(const std::vector<std::string>& argv) {
  std::vector<char*> result;
  result.reserve(argv.size() + 1);
  for(const auto& a : argv) {
    result.push_back(const_cast<char*>(a.c_str()));
  }
  result.push_back(nullptr);
  return result;
}

void
ClosePipe(int (&fds)[2]) {
  for(int& fd : fds) {
    if(fd >= 0) {
      ::close(fd);
      fd = -1;
    }
  }
}
}

ProcessResult
RunProcess(const std::vector<std::string>& argv,
           const ProcessOptions& options) {
  ProcessResult result;
  if(argv.empty()) {
    result.error = "empty command";
    return result;
  }

  int outPipe[2] = { -1, -1 };
  int errPipe[2] = { -1, -1 };
  if(::pipe(outPipe) != 0 || ::pipe(errPipe) != 0) {
    result.error = std::string("pipe() failed: ") + std::strerror(errno);
    ClosePipe(outPipe);
    ClosePipe(errPipe);
    return result;
  }

  FileActions fa;
  posix_spawn_file_actions_addclose(&fa.actions, outPipe[0]);
  posix_spawn_file_actions_addclose(&fa.actions, errPipe[0]);
  posix_spawn_file_actions_adddup2(&fa.actions, outPipe[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&fa.actions, errPipe[1], STDERR_FILENO);
  posix_spawn_file_actions_addclose(&fa.actions, outPipe[1]);
  posix_spawn_file_actions_addclose(&fa.actions, errPipe[1]);
  if(!options.cwd.empty()) {
    posix_spawn_file_actions_addchdir_np(&fa.actions, options.cwd.c_str());
  }

  auto cargv = MakeArgv(argv);
  pid_t pid = 0;
  int rc =
    posix_spawnp(&pid, cargv[0], &fa.actions, nullptr, cargv.data(), environ);

  ::close(outPipe[1]);
  outPipe[1] = -1;
  ::close(errPipe[1]);
  errPipe[1] = -1;

  if(rc != 0) {
    result.error = "Could not launch " + argv[0] + ": " + std::strerror(rc);
    flot_log(FLOT_GENERAL, FLOT_DEBUG, "{}", result.error);
    ClosePipe(outPipe);
    ClosePipe(errPipe);
    return result;
  }
  result.started = true;

  auto deadline = std::chrono::steady_clock::now() + options.timeout;

  pollfd fds[2] = { { outPipe[0], POLLIN, 0 }, { errPipe[0], POLLIN, 0 } };
  int open = 2;
  char buf[4096];
  while(open > 0) {
    int waitMs = -1;
    if(options.timeout.count() > 0) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
      if(left.count() <= 0) {
        result.timedOut = true;
        break;
      }
      waitMs = static_cast<int>(left.count());
    }

    int n = ::poll(fds, 2, waitMs);
    if(n < 0) {
      if(errno == EINTR)
        continue;
      break;
    }
    if(n == 0)
      continue;

    for(int i = 0; i < 2; ++i) {
      if(fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
        continue;
      ssize_t r = ::read(fds[i].fd, buf, sizeof(buf));
      if(r > 0) {
        (i == 0 ? result.out : result.err).append(buf, r);
      } else if(r == 0 || errno != EINTR) {
        fds[i].fd = -1;
        --open;
      }
    }
  }

  if(result.timedOut) {
    flot_log(FLOT_GENERAL,
             FLOT_LOCALWARNING,
             "Command {} timed out after {}ms, killing pid {}",
             argv[0],
             options.timeout.count(),
             pid);
    ::kill(pid, SIGKILL);
  }

  ClosePipe(outPipe);
  ClosePipe(errPipe);

  int status = 0;
  while(::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
  if(WIFEXITED(status)) {
    result.exitCode = WEXITSTATUS(status);
  } else if(WIFSIGNALED(status)) {
    result.exitCode = 128 + WTERMSIG(status);
  }
  return result;
}

pid_t
SpawnDetached(const std::vector<std::string>& argv,
              const std::string& cwd,
              const std::string& logFile,
              std::string& error) {
  if(argv.empty()) {
    error = "empty command";
    return -1;
  }

  FileActions fa;
  if(!cwd.empty()) {
    posix_spawn_file_actions_addchdir_np(&fa.actions, cwd.c_str());
  }
  if(!logFile.empty()) {
    posix_spawn_file_actions_addopen(&fa.actions,
                                     STDIN_FILENO,
                                     "/dev/null",
                                     O_RDONLY,
                                     0);
    posix_spawn_file_actions_addopen(&fa.actions,
                                     STDOUT_FILENO,
                                     logFile.c_str(),
                                     O_WRONLY | O_CREAT | O_APPEND,
                                     0644);
    posix_spawn_file_actions_adddup2(&fa.actions, STDOUT_FILENO, STDERR_FILENO);
  }

  // Own process group, so that a SIGINT to the orchestrator does not reach
  // the workers.
  posix_spawnattr_t attr;
  posix_spawnattr_init(&attr);
  posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP);
  posix_spawnattr_setpgroup(&attr, 0);

  auto cargv = MakeArgv(argv);
  pid_t pid = 0;
  int rc =
    posix_spawnp(&pid, cargv[0], &fa.actions, &attr, cargv.data(), environ);
  posix_spawnattr_destroy(&attr);

  if(rc != 0) {
    error = "Could not launch " + argv[0] + ": " + std::strerror(rc);
    return -1;
  }
  return pid;
}

bool
IsProcessAlive(pid_t pid) {
  if(pid <= 0)
    return false;

  int status = 0;
  pid_t r = ::waitpid(pid, &status, WNOHANG);
  if(r == pid)
    return false;
  if(r == 0)
    return true;

  // Not our child (e.g. spawned before a restart), fall back to signal 0.
  return ::kill(pid, 0) == 0 || errno == EPERM;
}
}
