#ifndef FLOTILLA_TASKS_JSON_TASK_STORE_HPP
#define FLOTILLA_TASKS_JSON_TASK_STORE_HPP

#include <memory>

#include <boost/filesystem/path.hpp>

#include "flotilla/tasks/task_store.hpp"

namespace flot::tasks {
/** @brief Task store kept in memory and mirrored into a single JSON file.
 *
 * An empty path keeps everything in memory only.
 */
class JsonTaskStore : public TaskStore {
  public:
  explicit JsonTaskStore(boost::filesystem::path path = {});
  virtual ~JsonTaskStore();

  /** @brief Reads the file. A missing file is an empty store. */
  flot_status load();

  flot_status add(Task task);
  flot_status addDependency(TaskDependency dependency);

  std::vector<Task> all() const;

  std::optional<Task> get(const std::string& id) const override;
  std::vector<Task> children(const std::string& parentId) const override;
  std::vector<TaskDependency> dependencies(
    const std::string& taskId) const override;
  flot_status updateStatus(const std::string& id, TaskStatus status) override;
  flot_status close(const std::string& id,
                    const std::string& reason,
                    const std::optional<std::string>& commitSha,
                    bool force = false) override;
  flot_status setValidation(const std::string& id,
                            ValidationStatus status,
                            uint32_t failCount) override;

  private:
  struct Internal;
  std::unique_ptr<Internal> m_internal;

  flot_status persist();
  flot_status loadLocked();
  /** @brief Re-reads the file if another process changed it. */
  void refresh() const;
};
}

#endif
