#ifndef FLOTILLA_WORKTREE_GIT_CLI_HPP
#define FLOTILLA_WORKTREE_GIT_CLI_HPP

#include <chrono>
#include <vector>

#include "flotilla/worktree/git_ops.hpp"

namespace flot::worktree {
/** @brief GitOps implemented by running the git executable. */
class GitCli : public GitOps {
  public:
  explicit GitCli(std::string repoPath,
                  std::chrono::seconds timeout = std::chrono::seconds(60));
  virtual ~GitCli();

  const std::string& repoPath() const override { return m_repoPath; }

  GitResult createWorktree(const std::string& path,
                           const std::string& branch,
                           const std::string& baseBranch,
                           bool createBranch = true) override;
  GitResult deleteWorktree(const std::string& path, bool force) override;
  GitResult deleteBranch(const std::string& branch) override;
  bool hasRemote(const std::string& remote) override;
  GitResult fetch(const std::string& remote,
                  const std::string& branch) override;
  GitResult checkout(const std::string& branch) override;
  GitResult pull(const std::string& remote,
                 const std::string& branch) override;
  GitResult merge(const std::string& branch,
                  const std::string& message) override;
  GitResult mergeAbort() override;
  GitResult revParse(const std::string& ref) override;
  GitResult push(const std::string& remote,
                 const std::string& branch) override;

  private:
  /** @brief Runs git with the given arguments. The message is used as the
   * result message on success and as prefix on failure. */
  GitResult run(const std::vector<std::string>& args,
                const std::string& what,
                const std::string& cwd = "");

  std::string m_repoPath;
  std::chrono::seconds m_timeout;
};
}

#endif
