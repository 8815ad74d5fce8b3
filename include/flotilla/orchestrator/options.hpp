#ifndef FLOTILLA_ORCHESTRATOR_OPTIONS_HPP
#define FLOTILLA_ORCHESTRATOR_OPTIONS_HPP

#include <cstdint>
#include <string>

namespace flot::orchestrator {
struct MergeOptions {
  bool mergeToBase = true;
  bool deleteWorktrees = true;
  bool deleteBranches = true;
  bool push = true;
  /** @brief Remove worktrees even with uncommitted changes. */
  bool force = false;
  /** @brief Used for worktrees that do not record their own base branch. */
  std::string baseBranch = "main";
  std::string remote = "origin";
};

struct ReviewOptions {
  /** @brief Completed work needs a valid validation status before it is
   * merged. */
  bool requireValidation = false;
  uint32_t maxValidationRetries = 3;
};
}

#endif
