#include <algorithm>
#include <map>
#include <mutex>
#include <shared_mutex>

#include <cereal/types/vector.hpp>

#include <flotilla/common/log.h>
#include <flotilla/tasks/json_task_store.hpp>
#include <flotilla/util/json_file.hpp>
#include <flotilla/util/timestamp.hpp>

namespace flot::tasks {
namespace {
struct TaskDocument {
  std::vector<Task> tasks;
  std::vector<TaskDependency> dependencies;

  template<class Archive>
  void serialize(Archive& ar) {
    ar(cereal::make_nvp("tasks", tasks),
       cereal::make_nvp("dependencies", dependencies));
  }
};
}

struct JsonTaskStore::Internal {
  boost::filesystem::path path;
  mutable std::shared_mutex mutex;
  std::map<std::string, Task> tasks;
  std::vector<TaskDependency> dependencies;

  // Workers modify the file from other processes.
  util::FileStamp stamp;
};

JsonTaskStore::JsonTaskStore(boost::filesystem::path path)
  : m_internal(std::make_unique<Internal>()) {
  m_internal->path = std::move(path);
}
JsonTaskStore::~JsonTaskStore() {}

flot_status
JsonTaskStore::load() {
  std::unique_lock lock(m_internal->mutex);
  return loadLocked();
}

void
JsonTaskStore::refresh() const {
  if(m_internal->path.empty())
    return;
  {
    std::shared_lock lock(m_internal->mutex);
    if(!m_internal->stamp.changed(m_internal->path))
      return;
  }
  std::unique_lock lock(m_internal->mutex);
  if(m_internal->stamp.changed(m_internal->path)) {
    const_cast<JsonTaskStore*>(this)->loadLocked();
  }
}

flot_status
JsonTaskStore::loadLocked() {
  if(m_internal->path.empty())
    return FLOT_OK;

  TaskDocument doc;
  flot_status s = util::LoadJson(m_internal->path, "tasks", doc);
  if(s == FLOT_FILE_NOT_FOUND_ERROR) {
    flot_log(FLOT_TASKS,
             FLOT_DEBUG,
             "No task file at {}, starting empty",
             m_internal->path.string());
    return FLOT_OK;
  }
  if(s != FLOT_OK)
    return s;

  m_internal->tasks.clear();
  for(auto& t : doc.tasks) {
    std::string id = t.id;
    m_internal->tasks.emplace(std::move(id), std::move(t));
  }
  m_internal->dependencies = std::move(doc.dependencies);
  m_internal->stamp.remember(m_internal->path);

  flot_log(FLOT_TASKS,
           FLOT_DEBUG,
           "Loaded {} tasks and {} dependencies from {}",
           m_internal->tasks.size(),
           m_internal->dependencies.size(),
           m_internal->path.string());
  return FLOT_OK;
}

flot_status
JsonTaskStore::persist() {
  if(m_internal->path.empty())
    return FLOT_OK;

  TaskDocument doc;
  doc.tasks.reserve(m_internal->tasks.size());
  for(const auto& e : m_internal->tasks) {
    doc.tasks.push_back(e.second);
  }
  doc.dependencies = m_internal->dependencies;
  flot_status s = util::SaveJson(m_internal->path, "tasks", doc);
  if(s == FLOT_OK)
    m_internal->stamp.remember(m_internal->path);
  return s;
}

flot_status
JsonTaskStore::add(Task task) {
  refresh();
  if(task.id.empty())
    return FLOT_INVALID_ARGUMENT;
  if(task.createdAt.empty())
    task.createdAt = util::NowIso();

  std::unique_lock lock(m_internal->mutex);
  std::string id = task.id;
  m_internal->tasks[id] = std::move(task);
  return persist();
}

flot_status
JsonTaskStore::addDependency(TaskDependency dependency) {
  refresh();
  if(dependency.taskId.empty() || dependency.dependsOn.empty() ||
     dependency.taskId == dependency.dependsOn)
    return FLOT_INVALID_ARGUMENT;

  std::unique_lock lock(m_internal->mutex);
  m_internal->dependencies.emplace_back(std::move(dependency));
  return persist();
}

std::vector<Task>
JsonTaskStore::all() const {
  refresh();
  std::shared_lock lock(m_internal->mutex);
  std::vector<Task> result;
  for(const auto& e : m_internal->tasks) {
    result.push_back(e.second);
  }
  return result;
}

std::optional<Task>
JsonTaskStore::get(const std::string& id) const {
  refresh();
  std::shared_lock lock(m_internal->mutex);
  auto it = m_internal->tasks.find(id);
  if(it == m_internal->tasks.end())
    return std::nullopt;
  return it->second;
}

std::vector<Task>
JsonTaskStore::children(const std::string& parentId) const {
  refresh();
  std::shared_lock lock(m_internal->mutex);
  std::vector<Task> result;
  for(const auto& e : m_internal->tasks) {
    if(e.second.parentId && *e.second.parentId == parentId)
      result.push_back(e.second);
  }
  return result;
}

std::vector<TaskDependency>
JsonTaskStore::dependencies(const std::string& taskId) const {
  refresh();
  std::shared_lock lock(m_internal->mutex);
  std::vector<TaskDependency> result;
  std::copy_if(m_internal->dependencies.begin(),
               m_internal->dependencies.end(),
               std::back_inserter(result),
               [&taskId](const TaskDependency& d) { return d.taskId == taskId; });
  return result;
}

flot_status
JsonTaskStore::updateStatus(const std::string& id, TaskStatus status) {
  refresh();
  std::unique_lock lock(m_internal->mutex);
  auto it = m_internal->tasks.find(id);
  if(it == m_internal->tasks.end())
    return FLOT_NOT_FOUND;

  Task& t = it->second;
  flot_log(FLOT_TASKS,
           FLOT_DEBUG,
           "Task {} status {} -> {}",
           id,
           TaskStatusToStr(t.status),
           TaskStatusToStr(status));
  t.status = status;
  if(status != TaskStatus::Closed) {
    t.closedAt.reset();
    t.closedReason.reset();
    t.closedCommitSha.reset();
  }
  return persist();
}

flot_status
JsonTaskStore::close(const std::string& id,
                     const std::string& reason,
                     const std::optional<std::string>& commitSha,
                     bool force) {
  refresh();
  std::unique_lock lock(m_internal->mutex);
  auto it = m_internal->tasks.find(id);
  if(it == m_internal->tasks.end())
    return FLOT_NOT_FOUND;

  if(!force) {
    for(const auto& e : m_internal->tasks) {
      if(e.second.parentId && *e.second.parentId == id &&
         e.second.status != TaskStatus::Closed) {
        flot_log(FLOT_TASKS,
                 FLOT_LOCALWARNING,
                 "Refusing to close task {}, child {} is still {}",
                 id,
                 e.second.id,
                 TaskStatusToStr(e.second.status));
        return FLOT_INVALID_ARGUMENT;
      }
    }
  }

  Task& t = it->second;
  t.status = TaskStatus::Closed;
  t.closedAt = util::NowIso();
  t.closedReason = reason;
  t.closedCommitSha = commitSha;
  return persist();
}

flot_status
JsonTaskStore::setValidation(const std::string& id,
                             ValidationStatus status,
                             uint32_t failCount) {
  refresh();
  std::unique_lock lock(m_internal->mutex);
  auto it = m_internal->tasks.find(id);
  if(it == m_internal->tasks.end())
    return FLOT_NOT_FOUND;
  it->second.validationStatus = status;
  it->second.validationFailCount = failCount;
  return persist();
}
}
