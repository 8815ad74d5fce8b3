#include <flotilla/worktree/worktree.hpp>

namespace flot::worktree {
const char*
WorktreeStatusToStr(WorktreeStatus status) {
  switch(status) {
    case WorktreeStatus::Active:
      return "active";
    case WorktreeStatus::Released:
      return "released";
    case WorktreeStatus::Merged:
      return "merged";
    case WorktreeStatus::Stale:
      return "stale";
    case WorktreeStatus::Abandoned:
      return "abandoned";
  }
  return "unknown";
}

std::optional<WorktreeStatus>
WorktreeStatusFromStr(std::string_view str) {
  if(str == "active")
    return WorktreeStatus::Active;
  if(str == "released")
    return WorktreeStatus::Released;
  if(str == "merged")
    return WorktreeStatus::Merged;
  if(str == "stale")
    return WorktreeStatus::Stale;
  if(str == "abandoned")
    return WorktreeStatus::Abandoned;
  return std::nullopt;
}
}
