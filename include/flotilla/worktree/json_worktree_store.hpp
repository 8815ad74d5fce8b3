#ifndef FLOTILLA_WORKTREE_JSON_WORKTREE_STORE_HPP
#define FLOTILLA_WORKTREE_JSON_WORKTREE_STORE_HPP

#include <memory>

#include <boost/filesystem/path.hpp>

#include "flotilla/worktree/worktree_store.hpp"

namespace flot::worktree {
/** @brief Worktree records mirrored into a single JSON file. An empty path
 * keeps them in memory only. */
class JsonWorktreeStore : public WorktreeStore {
  public:
  explicit JsonWorktreeStore(boost::filesystem::path path = {});
  virtual ~JsonWorktreeStore();

  flot_status load();

  std::optional<Worktree> create(Worktree worktree) override;
  std::optional<Worktree> get(const std::string& id) const override;
  std::optional<Worktree> getByTask(const std::string& taskId) const override;
  std::optional<Worktree> getByBranch(
    const std::string& project,
    const std::string& branchName) const override;
  std::vector<Worktree> list(const std::string& project = "") const override;
  flot_status claim(const std::string& id,
                    const std::string& sessionId) override;
  flot_status release(const std::string& id) override;
  flot_status updateStatus(const std::string& id,
                           WorktreeStatus status) override;
  flot_status remove(const std::string& id) override;

  private:
  struct Internal;
  std::unique_ptr<Internal> m_internal;

  flot_status persist();
  flot_status loadLocked();
  void refresh() const;
};
}

#endif
