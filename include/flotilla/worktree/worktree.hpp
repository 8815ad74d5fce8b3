#ifndef FLOTILLA_WORKTREE_WORKTREE_HPP
#define FLOTILLA_WORKTREE_WORKTREE_HPP

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <cereal/cereal.hpp>
#include <cereal/types/optional.hpp>
#include <cereal/types/string.hpp>

namespace flot::worktree {
enum class WorktreeStatus { Active, Released, Merged, Stale, Abandoned };

const char*
WorktreeStatusToStr(WorktreeStatus status);
std::optional<WorktreeStatus>
WorktreeStatusFromStr(std::string_view str);

struct Worktree {
  std::string id;
  std::string project;
  std::string branchName;
  std::string path;
  std::string baseBranch = "main";
  std::optional<std::string> taskId;
  std::optional<std::string> agentSessionId;
  WorktreeStatus status = WorktreeStatus::Active;
  std::string createdAt;
  std::string updatedAt;

  /** @brief Active and claimed by a worker session. */
  bool owned() const {
    return status == WorktreeStatus::Active && agentSessionId &&
           !agentSessionId->empty();
  }

  template<class Archive>
  void save(Archive& ar) const {
    ar(cereal::make_nvp("id", id),
       cereal::make_nvp("project", project),
       cereal::make_nvp("branch_name", branchName),
       cereal::make_nvp("path", path),
       cereal::make_nvp("base_branch", baseBranch),
       cereal::make_nvp("task_id", taskId),
       cereal::make_nvp("agent_session_id", agentSessionId),
       cereal::make_nvp("status", std::string(WorktreeStatusToStr(status))),
       cereal::make_nvp("created_at", createdAt),
       cereal::make_nvp("updated_at", updatedAt));
  }

  template<class Archive>
  void load(Archive& ar) {
    std::string statusStr;
    ar(cereal::make_nvp("id", id),
       cereal::make_nvp("project", project),
       cereal::make_nvp("branch_name", branchName),
       cereal::make_nvp("path", path),
       cereal::make_nvp("base_branch", baseBranch),
       cereal::make_nvp("task_id", taskId),
       cereal::make_nvp("agent_session_id", agentSessionId),
       cereal::make_nvp("status", statusStr),
       cereal::make_nvp("created_at", createdAt),
       cereal::make_nvp("updated_at", updatedAt));
    status = WorktreeStatusFromStr(statusStr).value_or(WorktreeStatus::Active);
  }
};
}

inline std::ostream&
operator<<(std::ostream& o, flot::worktree::WorktreeStatus status) {
  return o << flot::worktree::WorktreeStatusToStr(status);
}

#endif
