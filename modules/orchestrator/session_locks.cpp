#include "session_locks.hpp"

namespace flot::orchestrator {
SessionLocks::Guard::Guard(SessionLocks& registry,
                           std::string sessionId,
                           std::mutex& mutex)
  : m_registry(&registry)
  , m_sessionId(std::move(sessionId))
  , m_lock(mutex) {}

SessionLocks::Guard::Guard(Guard&& o) noexcept
  : m_registry(o.m_registry)
  , m_sessionId(std::move(o.m_sessionId))
  , m_lock(std::move(o.m_lock)) {
  o.m_registry = nullptr;
}

SessionLocks::Guard::~Guard() {
  if(!m_registry)
    return;
  // The mutex may be destroyed by release.
  if(m_lock.owns_lock())
    m_lock.unlock();
  m_registry->release(m_sessionId);
}

SessionLocks&
SessionLocks::Process() {
  static SessionLocks locks;
  return locks;
}

SessionLocks::Guard
SessionLocks::lock(const std::string& sessionId) {
  Entry* entry = nullptr;
  {
    std::lock_guard registryLock(m_registryMutex);
    auto& slot = m_locks[sessionId];
    if(!slot)
      slot = std::make_unique<Entry>();
    ++slot->users;
    entry = slot.get();
  }
  return Guard(*this, sessionId, entry->mutex);
}

size_t
SessionLocks::size() const {
  std::lock_guard registryLock(m_registryMutex);
  return m_locks.size();
}

void
SessionLocks::release(const std::string& sessionId) {
  std::lock_guard registryLock(m_registryMutex);
  auto it = m_locks.find(sessionId);
  if(it != m_locks.end() && --it->second->users == 0)
    m_locks.erase(it);
}
}
