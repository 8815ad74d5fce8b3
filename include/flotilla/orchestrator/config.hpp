#ifndef FLOTILLA_ORCHESTRATOR_CONFIG_HPP
#define FLOTILLA_ORCHESTRATOR_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <cereal/cereal.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>

namespace flot::orchestrator {
struct OrchestratorConfig {
  std::string project = "default";
  std::string repoPath = ".";
  std::string baseBranch = "main";
  std::string remote = "origin";
  std::string worktreeRoot = "/tmp/flotilla-worktrees";
  std::string projectConfigDir = ".flotilla";

  std::vector<std::string> agentCommand{ "claude", "{prompt}" };
  std::string tmuxExecutable = "tmux";
  uint32_t maxAgentDepth = 1;

  uint32_t maxConcurrent = 3;
  std::string defaultMode = "terminal";

  /** @brief Completed work only goes to review once its task validated. */
  bool requireValidation = false;
  uint32_t maxValidationRetries = 3;

  bool pushAfterMerge = true;
  uint32_t gitTimeoutSeconds = 60;
  uint32_t staleAfterHours = 24;

  template<class Archive>
  void serialize(Archive& ar) {
    ar(cereal::make_nvp("project", project),
       cereal::make_nvp("repoPath", repoPath),
       cereal::make_nvp("baseBranch", baseBranch),
       cereal::make_nvp("remote", remote),
       cereal::make_nvp("worktreeRoot", worktreeRoot),
       cereal::make_nvp("projectConfigDir", projectConfigDir),
       cereal::make_nvp("agentCommand", agentCommand),
       cereal::make_nvp("tmuxExecutable", tmuxExecutable),
       cereal::make_nvp("maxAgentDepth", maxAgentDepth),
       cereal::make_nvp("maxConcurrent", maxConcurrent),
       cereal::make_nvp("defaultMode", defaultMode),
       cereal::make_nvp("requireValidation", requireValidation),
       cereal::make_nvp("maxValidationRetries", maxValidationRetries),
       cereal::make_nvp("pushAfterMerge", pushAfterMerge),
       cereal::make_nvp("gitTimeoutSeconds", gitTimeoutSeconds),
       cereal::make_nvp("staleAfterHours", staleAfterHours));
  }
};
}

#endif
