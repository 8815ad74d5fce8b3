#ifndef FLOTILLA_AGENTS_PROCESS_AGENT_RUNNER_HPP
#define FLOTILLA_AGENTS_PROCESS_AGENT_RUNNER_HPP

#include <mutex>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>

#include "flotilla/agents/agent_runner.hpp"

namespace flot::agents {
struct ProcessRunnerConfig {
  /** @brief Worker command. The argument "{prompt}" is replaced by the task
   * prompt, without it the prompt is appended as last argument. */
  std::vector<std::string> command{ "claude", "{prompt}" };
  std::string tmuxExecutable = "tmux";
  uint32_t maxDepth = 1;
  /** @brief Headless output, relative to the worktree. */
  std::string logFile = ".flotilla/agent.log";
};

/** @brief Runs workers as local processes.
 *
 * Every run is recorded in a JSON registry next to the other state, so
 * liveness and nesting depth are known across restarts of the orchestrator.
 * Workers receive FLOT_SESSION_ID, FLOT_PARENT_SESSION_ID, FLOT_TASK_ID and
 * FLOT_WORKTREE_ID in their environment.
 */
class ProcessAgentRunner : public AgentRunner {
  public:
  ProcessAgentRunner(boost::filesystem::path registry,
                     ProcessRunnerConfig config);
  virtual ~ProcessAgentRunner();

  SpawnCheck canSpawn(const std::string& parentSessionId) override;
  SpawnResult spawn(const SpawnRequest& request) override;
  std::optional<AgentHandle> getRunning(const std::string& sessionId) override;

  struct RunRecord;

  private:
  std::vector<std::string> buildCommand(const SpawnRequest& request,
                                        const std::string& sessionId) const;
  uint32_t depthOf(const std::vector<RunRecord>& runs,
                   const std::string& sessionId) const;
  bool alive(const RunRecord& run) const;

  boost::filesystem::path m_registry;
  ProcessRunnerConfig m_config;
  std::mutex m_mutex;
};
}

#endif
