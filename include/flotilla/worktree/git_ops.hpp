#ifndef FLOTILLA_WORKTREE_GIT_OPS_HPP
#define FLOTILLA_WORKTREE_GIT_OPS_HPP

#include <string>

namespace flot::worktree {
/** @brief Outcome of a git operation.
 *
 * Expected failures (conflicts, missing branches, existing paths) are
 * reported here and never thrown.
 */
struct GitResult {
  bool success = false;
  std::string message;
  std::string output;
  std::string error;

  static GitResult ok(std::string message, std::string output = "") {
    return GitResult{ true, std::move(message), std::move(output), "" };
  }
  static GitResult fail(std::string message, std::string error = "") {
    return GitResult{ false, std::move(message), "", std::move(error) };
  }
};

/** @brief The git sequences the orchestrator performs on a repository.
 *
 * All operations without an explicit path run in the main repository.
 */
class GitOps {
  public:
  virtual ~GitOps() = default;

  virtual const std::string& repoPath() const = 0;

  /** @brief Add a worktree at path. Fails if path already exists. */
  virtual GitResult createWorktree(const std::string& path,
                                   const std::string& branch,
                                   const std::string& baseBranch,
                                   bool createBranch = true) = 0;

  /** @brief Remove the worktree at path. Force also removes a worktree with
   * uncommitted changes. Succeeds if the worktree is already gone. */
  virtual GitResult deleteWorktree(const std::string& path, bool force) = 0;

  /** @brief Delete a local branch whether or not it was merged. Succeeds if
   * the branch does not exist. */
  virtual GitResult deleteBranch(const std::string& branch) = 0;

  virtual bool hasRemote(const std::string& remote) = 0;
  virtual GitResult fetch(const std::string& remote,
                          const std::string& branch) = 0;
  virtual GitResult checkout(const std::string& branch) = 0;
  virtual GitResult pull(const std::string& remote,
                         const std::string& branch) = 0;
  /** @brief Merge branch into the checked out branch. On conflict the
   * result fails and output or error contains "CONFLICT". */
  virtual GitResult merge(const std::string& branch,
                          const std::string& message) = 0;
  virtual GitResult mergeAbort() = 0;
  virtual GitResult revParse(const std::string& ref) = 0;
  virtual GitResult push(const std::string& remote,
                         const std::string& branch) = 0;
};
}

#endif
