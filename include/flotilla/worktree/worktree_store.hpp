#ifndef FLOTILLA_WORKTREE_WORKTREE_STORE_HPP
#define FLOTILLA_WORKTREE_WORKTREE_STORE_HPP

#include <optional>
#include <string>
#include <vector>

#include "flotilla/common/status.h"
#include "flotilla/worktree/worktree.hpp"

namespace flot::worktree {
/** @brief Records of worktrees, independent of their state on disk. */
class WorktreeStore {
  public:
  virtual ~WorktreeStore() = default;

  /** @brief Stores a new record, assigning id and timestamps if empty. */
  virtual std::optional<Worktree> create(Worktree worktree) = 0;

  virtual std::optional<Worktree> get(const std::string& id) const = 0;

  /** @brief The most recent non-merged, non-abandoned record for a task. */
  virtual std::optional<Worktree> getByTask(
    const std::string& taskId) const = 0;
  virtual std::optional<Worktree> getByBranch(
    const std::string& project,
    const std::string& branchName) const = 0;

  /** @brief All records, optionally restricted to a project. */
  virtual std::vector<Worktree> list(const std::string& project = "") const = 0;

  virtual flot_status claim(const std::string& id,
                            const std::string& sessionId) = 0;
  /** @brief Clears the owning session and marks the record released. */
  virtual flot_status release(const std::string& id) = 0;
  virtual flot_status updateStatus(const std::string& id,
                                   WorktreeStatus status) = 0;
  virtual flot_status remove(const std::string& id) = 0;
};
}

#endif
