#include <algorithm>
#include <cctype>

#include <flotilla/state/orchestration_state.hpp>

namespace flot::state {
bool
SpawnedAgent::validSessionId() const {
  if(sessionId.empty())
    return false;
  return std::none_of(sessionId.begin(), sessionId.end(), [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) ||
           std::iscntrl(static_cast<unsigned char>(c));
  });
}

bool
OrchestrationState::tracksSpawnedTask(const std::string& taskId) const {
  return std::any_of(spawned.begin(),
                     spawned.end(),
                     [&taskId](const SpawnedAgent& a) {
                       return a.taskId == taskId;
                     });
}
}
