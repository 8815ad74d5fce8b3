#ifndef FLOTILLA_AGENTS_AGENT_RUNNER_HPP
#define FLOTILLA_AGENTS_AGENT_RUNNER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace flot::agents {
enum class SpawnMode { Terminal, Embedded, Headless };

const char*
SpawnModeToStr(SpawnMode mode);
/** @brief Parses one of the supported mode names, nullopt otherwise. */
std::optional<SpawnMode>
SpawnModeFromStr(std::string_view str);

struct SpawnCheck {
  bool ok = false;
  std::string reason;
  uint32_t depth = 0;
};

struct SpawnRequest {
  std::string parentSessionId;
  std::string taskId;
  std::string title;
  std::string worktreeId;
  std::string workdir;
  std::string prompt;
  SpawnMode mode = SpawnMode::Terminal;
};

struct AgentHandle {
  std::string sessionId;
  std::string runId;
  int64_t pid = 0;
  SpawnMode mode = SpawnMode::Terminal;
};

struct SpawnResult {
  bool success = false;
  std::string error;
  AgentHandle handle;
};

/** @brief Launches and observes worker sessions.
 *
 * Liveness must be answerable from durable records, handles of earlier
 * processes are never assumed to be around.
 */
class AgentRunner {
  public:
  virtual ~AgentRunner() = default;

  /** @brief Whether the given session may start another worker, and the
   * nesting depth the worker would run at. */
  virtual SpawnCheck canSpawn(const std::string& parentSessionId) = 0;

  virtual SpawnResult spawn(const SpawnRequest& request) = 0;

  /** @brief Handle of the session if its worker is still alive. */
  virtual std::optional<AgentHandle> getRunning(
    const std::string& sessionId) = 0;
};
}

#endif
