#include <algorithm>
#include <functional>
#include <map>
#include <set>
#include <tuple>

#include <flotilla/common/log.h>
#include <flotilla/tasks/task_graph_resolver.hpp>
#include <flotilla/tasks/task_store.hpp>

namespace flot::tasks {
namespace {
bool
ScheduleOrder(const Task& l, const Task& r) {
  return std::tie(l.priority, l.createdAt, l.id) <
         std::tie(r.priority, r.createdAt, r.id);
}
}

TaskGraphResolver::TaskGraphResolver(const TaskStore& store)
  : m_store(store) {}
TaskGraphResolver::~TaskGraphResolver() {}

bool
TaskGraphResolver::blocked(const Task& task) const {
  for(const auto& dep : m_store.dependencies(task.id)) {
    if(!dep.blocks())
      continue;
    auto blocker = m_store.get(dep.dependsOn);
    if(!blocker) {
      flot_log(FLOT_TASKS,
               FLOT_LOCALWARNING,
               "Task {} depends on unknown task {}, treating it as blocked",
               task.id,
               dep.dependsOn);
      return true;
    }
    if(blocker->status != TaskStatus::Closed) {
      flot_log(FLOT_TASKS,
               FLOT_TRACE,
               "Task {} is blocked by {} ({})",
               task.id,
               blocker->id,
               TaskStatusToStr(blocker->status));
      return true;
    }
  }
  return false;
}

TaskGraphResolver::Result
TaskGraphResolver::readyDescendants(const std::string& parentId) const {
  Result result;

  auto parent = m_store.get(parentId);
  if(!parent) {
    result.status = FLOT_NOT_FOUND;
    result.error = "Invalid parent_task_id: " + parentId;
    return result;
  }

  // Maps every ready task to its nearest ready ancestor, so that one can be
  // emitted first.
  std::map<std::string, std::string> readyAncestorOf;
  std::vector<Task> ready;
  std::set<std::string> visited{ parentId };

  std::function<void(const Task&, bool, const std::string&)> walk =
    [&](const Task& node, bool ancestorBlocked, const std::string& readyAbove) {
    for(auto& child : m_store.children(node.id)) {
      if(!visited.insert(child.id).second) {
        flot_log(FLOT_TASKS,
                 FLOT_LOCALWARNING,
                 "Task {} reached twice below {}, hierarchy contains a cycle",
                 child.id,
                 parentId);
        continue;
      }
      bool childBlocked = ancestorBlocked || blocked(child);
      std::string nextReadyAbove = readyAbove;
      if(!childBlocked && child.status == TaskStatus::Open) {
        readyAncestorOf[child.id] = readyAbove;
        nextReadyAbove = child.id;
        ready.push_back(child);
      }
      walk(child, childBlocked, nextReadyAbove);
    }
  };
  walk(*parent, blocked(*parent), std::string());

  std::sort(ready.begin(), ready.end(), &ScheduleOrder);

  std::map<std::string, const Task*> byId;
  for(const auto& t : ready) {
    byId[t.id] = &t;
  }

  std::set<std::string> emitted;
  std::function<void(const Task&)> emit = [&](const Task& t) {
    if(emitted.count(t.id))
      return;
    auto p = byId.find(readyAncestorOf[t.id]);
    if(p != byId.end()) {
      emit(*p->second);
    }
    emitted.insert(t.id);
    result.ready.push_back(t);
  };
  for(const auto& t : ready) {
    emit(t);
  }

  flot_log(FLOT_TASKS,
           FLOT_DEBUG,
           "Resolved {} ready tasks below {}",
           result.ready.size(),
           parentId);
  return result;
}
}
