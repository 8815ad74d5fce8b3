#include <algorithm>
#include <map>
#include <mutex>
#include <shared_mutex>

#include <cereal/types/vector.hpp>

#include <flotilla/common/log.h>
#include <flotilla/util/json_file.hpp>
#include <flotilla/util/random.hpp>
#include <flotilla/util/timestamp.hpp>
#include <flotilla/worktree/json_worktree_store.hpp>

namespace flot::worktree {
struct JsonWorktreeStore::Internal {
  boost::filesystem::path path;
  mutable std::shared_mutex mutex;
  std::map<std::string, Worktree> worktrees;
  util::FileStamp stamp;

  Worktree* find(const std::string& id) {
    auto it = worktrees.find(id);
    return it == worktrees.end() ? nullptr : &it->second;
  }
};

JsonWorktreeStore::JsonWorktreeStore(boost::filesystem::path path)
  : m_internal(std::make_unique<Internal>()) {
  m_internal->path = std::move(path);
}
JsonWorktreeStore::~JsonWorktreeStore() {}

flot_status
JsonWorktreeStore::load() {
  std::unique_lock lock(m_internal->mutex);
  return loadLocked();
}

flot_status
JsonWorktreeStore::loadLocked() {
  if(m_internal->path.empty())
    return FLOT_OK;

  std::vector<Worktree> worktrees;
  flot_status s = util::LoadJson(m_internal->path, "worktrees", worktrees);
  if(s == FLOT_FILE_NOT_FOUND_ERROR)
    return FLOT_OK;
  if(s != FLOT_OK)
    return s;

  m_internal->worktrees.clear();
  for(auto& w : worktrees) {
    std::string id = w.id;
    m_internal->worktrees.emplace(std::move(id), std::move(w));
  }
  m_internal->stamp.remember(m_internal->path);
  return FLOT_OK;
}

void
JsonWorktreeStore::refresh() const {
  if(m_internal->path.empty())
    return;
  {
    std::shared_lock lock(m_internal->mutex);
    if(!m_internal->stamp.changed(m_internal->path))
      return;
  }
  std::unique_lock lock(m_internal->mutex);
  if(m_internal->stamp.changed(m_internal->path)) {
    flot_log(FLOT_WORKTREE,
             FLOT_TRACE,
             "{} changed on disk, reloading",
             m_internal->path.string());
    const_cast<JsonWorktreeStore*>(this)->loadLocked();
  }
}

flot_status
JsonWorktreeStore::persist() {
  if(m_internal->path.empty())
    return FLOT_OK;

  std::vector<Worktree> worktrees;
  worktrees.reserve(m_internal->worktrees.size());
  for(const auto& e : m_internal->worktrees) {
    worktrees.push_back(e.second);
  }
  flot_status s = util::SaveJson(m_internal->path, "worktrees", worktrees);
  if(s == FLOT_OK)
    m_internal->stamp.remember(m_internal->path);
  return s;
}

std::optional<Worktree>
JsonWorktreeStore::create(Worktree worktree) {
  refresh();
  std::unique_lock lock(m_internal->mutex);
  if(worktree.id.empty()) {
    do {
      worktree.id = util::RandomId("wt", 6);
    } while(m_internal->worktrees.count(worktree.id));
  } else if(m_internal->worktrees.count(worktree.id)) {
    flot_log(FLOT_WORKTREE,
             FLOT_LOCALERROR,
             "Worktree record {} already exists",
             worktree.id);
    return std::nullopt;
  }

  auto now = util::NowIso();
  if(worktree.createdAt.empty())
    worktree.createdAt = now;
  worktree.updatedAt = now;

  m_internal->worktrees[worktree.id] = worktree;
  if(persist() != FLOT_OK) {
    m_internal->worktrees.erase(worktree.id);
    return std::nullopt;
  }
  return worktree;
}

std::optional<Worktree>
JsonWorktreeStore::get(const std::string& id) const {
  refresh();
  std::shared_lock lock(m_internal->mutex);
  auto it = m_internal->worktrees.find(id);
  if(it == m_internal->worktrees.end())
    return std::nullopt;
  return it->second;
}

std::optional<Worktree>
JsonWorktreeStore::getByTask(const std::string& taskId) const {
  refresh();
  std::shared_lock lock(m_internal->mutex);
  const Worktree* best = nullptr;
  for(const auto& e : m_internal->worktrees) {
    const Worktree& w = e.second;
    if(!w.taskId || *w.taskId != taskId)
      continue;
    if(w.status == WorktreeStatus::Merged ||
       w.status == WorktreeStatus::Abandoned)
      continue;
    if(!best || w.createdAt > best->createdAt)
      best = &w;
  }
  if(!best)
    return std::nullopt;
  return *best;
}

std::optional<Worktree>
JsonWorktreeStore::getByBranch(const std::string& project,
                               const std::string& branchName) const {
  refresh();
  std::shared_lock lock(m_internal->mutex);
  for(const auto& e : m_internal->worktrees) {
    if(e.second.project == project && e.second.branchName == branchName)
      return e.second;
  }
  return std::nullopt;
}

std::vector<Worktree>
JsonWorktreeStore::list(const std::string& project) const {
  refresh();
  std::shared_lock lock(m_internal->mutex);
  std::vector<Worktree> result;
  for(const auto& e : m_internal->worktrees) {
    if(project.empty() || e.second.project == project)
      result.push_back(e.second);
  }
  return result;
}

flot_status
JsonWorktreeStore::claim(const std::string& id, const std::string& sessionId) {
  refresh();
  std::unique_lock lock(m_internal->mutex);
  Worktree* w = m_internal->find(id);
  if(!w)
    return FLOT_NOT_FOUND;
  if(w->owned() && *w->agentSessionId != sessionId) {
    flot_log(FLOT_WORKTREE,
             FLOT_LOCALWARNING,
             "Worktree {} already claimed by session {}",
             id,
             *w->agentSessionId);
    return FLOT_ALREADY_EXISTS;
  }
  w->agentSessionId = sessionId;
  w->status = WorktreeStatus::Active;
  w->updatedAt = util::NowIso();
  return persist();
}

flot_status
JsonWorktreeStore::release(const std::string& id) {
  refresh();
  std::unique_lock lock(m_internal->mutex);
  Worktree* w = m_internal->find(id);
  if(!w)
    return FLOT_NOT_FOUND;
  w->agentSessionId.reset();
  if(w->status == WorktreeStatus::Active)
    w->status = WorktreeStatus::Released;
  w->updatedAt = util::NowIso();
  return persist();
}

flot_status
JsonWorktreeStore::updateStatus(const std::string& id, WorktreeStatus status) {
  refresh();
  std::unique_lock lock(m_internal->mutex);
  Worktree* w = m_internal->find(id);
  if(!w)
    return FLOT_NOT_FOUND;
  w->status = status;
  w->updatedAt = util::NowIso();
  return persist();
}

flot_status
JsonWorktreeStore::remove(const std::string& id) {
  refresh();
  std::unique_lock lock(m_internal->mutex);
  if(!m_internal->worktrees.erase(id))
    return FLOT_NOT_FOUND;
  return persist();
}
}
