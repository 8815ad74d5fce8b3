#ifndef FLOTILLA_AGENTS_AGENT_SPAWNER_HPP
#define FLOTILLA_AGENTS_AGENT_SPAWNER_HPP

#include <string>

#include "flotilla/agents/agent_runner.hpp"

namespace flot::tasks {
struct Task;
}
namespace flot::worktree {
struct Worktree;
}

namespace flot::agents {
struct SpawnOutcome {
  bool success = false;
  std::string reason;
  AgentHandle handle;
};

/** @brief Binds workers to provisioned worktrees through an AgentRunner. */
class AgentSpawner {
  public:
  explicit AgentSpawner(AgentRunner& runner);
  ~AgentSpawner();

  static std::string BuildPrompt(const tasks::Task& task);

  SpawnCheck check(const std::string& parentSessionId);

  /** @brief Launch a worker in the worktree. Runner errors and exceptions
   * are reported as failed outcomes. */
  SpawnOutcome spawn(const worktree::Worktree& worktree,
                     const tasks::Task& task,
                     const std::string& parentSessionId,
                     SpawnMode mode);

  private:
  AgentRunner& m_runner;
};
}

#endif
