#ifndef FLOTILLA_WORKTREE_WORKTREE_PROVISIONER_HPP
#define FLOTILLA_WORKTREE_WORKTREE_PROVISIONER_HPP

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <cereal/types/utility.hpp>
#include <cereal/types/vector.hpp>

#include "flotilla/common/status.h"
#include "flotilla/worktree/worktree.hpp"

namespace flot::tasks {
struct Task;
}

namespace flot::worktree {
class WorktreeStore;
class GitOps;

struct ProvisionerConfig {
  std::string project;
  std::string worktreeRoot = "/tmp/flotilla-worktrees";
  std::string baseBranch = "main";
  /** @brief Relative to the repository, copied into every new worktree. */
  std::string projectConfigDir = ".flotilla";
};

struct ProvisionResult {
  bool success = false;
  /** @brief A released worktree of an earlier attempt was picked up. */
  bool reused = false;
  std::string reason;
  std::optional<Worktree> worktree;
};

struct StaleCleanupResult {
  std::vector<Worktree> candidates;
  std::vector<std::string> cleaned;
  /** @brief Worktree id and failure reason. */
  std::vector<std::pair<std::string, std::string>> failed;
  bool dryRun = false;

  template<class Archive>
  void serialize(Archive& ar) {
    ar(cereal::make_nvp("candidates", candidates),
       cereal::make_nvp("cleaned", cleaned),
       cereal::make_nvp("failed", failed),
       cereal::make_nvp("dry_run", dryRun));
  }
};

/** @brief Owns the lifecycle of per-task worktrees.
 *
 * Provisioning is the only place new worktree records are created. Its check
 * for an existing worktree and the creation happen under one lock, so a task
 * never gets two owned worktrees. A provisioned worktree stays active and
 * unowned until claimed, and is not handed out again in between.
 */
class WorktreeProvisioner {
  public:
  WorktreeProvisioner(WorktreeStore& store,
                      GitOps& git,
                      ProvisionerConfig config);
  ~WorktreeProvisioner();

  static std::string BranchName(const std::string& taskId);
  std::string worktreePath(const std::string& branchName) const;

  ProvisionResult provision(const tasks::Task& task);

  flot_status claim(const std::string& worktreeId,
                    const std::string& sessionId);

  /** @brief Clears ownership, keeps files and branch. */
  flot_status release(const std::string& worktreeId);

  /** @brief Removes files, record and optionally the branch. OK if the
   * record is missing. If git keeps the files the record stays, a failed
   * branch deletion is reported after the record is gone. */
  flot_status destroy(const std::string& worktreeId,
                      bool force = true,
                      bool deleteBranch = true);

  /** @brief Marks unowned active worktrees older than the cutoff stale and
   * destroys stale and abandoned ones older than the cutoff. */
  StaleCleanupResult cleanupStale(std::chrono::hours olderThan,
                                  bool dryRun = false);

  const ProvisionerConfig& config() const { return m_config; }

  private:
  /** @brief Undo a half created worktree, used when initialization fails. */
  void rollback(const Worktree& worktree, bool gitCreated);

  WorktreeStore& m_store;
  GitOps& m_git;
  ProvisionerConfig m_config;
  std::mutex m_mutex;
};
}

#endif
