#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <sys/types.h>

namespace flot::util {
struct ProcessResult {
  bool started = false;
  bool timedOut = false;
  int exitCode = -1;
  std::string out;
  std::string err;

  /** @brief Set if the process could not be launched at all. */
  std::string error;

  bool ok() const { return started && !timedOut && exitCode == 0; }
};

struct ProcessOptions {
  std::string cwd;
  /** @brief Zero means no timeout. */
  std::chrono::milliseconds timeout{ 0 };
};

/** @brief Run a command to completion, capturing stdout and stderr.
 *
 * The command is looked up in PATH. The child is killed with SIGKILL once the
 * timeout elapses.
 */
ProcessResult
RunProcess(const std::vector<std::string>& argv,
           const ProcessOptions& options = {});

/** @brief Launch a command without waiting for it.
 *
 * stdout and stderr are appended to logFile if it is not empty, otherwise the
 * child inherits the stdio of this process. Returns the pid, or -1 on error
 * with the reason written to error.
 */
pid_t
SpawnDetached(const std::vector<std::string>& argv,
              const std::string& cwd,
              const std::string& logFile,
              std::string& error);

/** @brief Checks liveness of a pid, reaping it if it is our exited child. */
bool
IsProcessAlive(pid_t pid);
}
