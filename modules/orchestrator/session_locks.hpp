#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace flot::orchestrator {
/** @brief One mutex per orchestrating session.
 *
 * Every pass that reads and writes a session document holds the session's
 * lock for its whole duration, making it the only writer of that document in
 * this process. A session's entry exists only while guards for it exist.
 */
class SessionLocks {
  public:
  /** @brief Holds the lock of one session. */
  class Guard {
    public:
    Guard(Guard&& o) noexcept;
    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;
    Guard& operator=(Guard&&) = delete;
    ~Guard();

    bool owns_lock() const { return m_lock.owns_lock(); }

    private:
    friend class SessionLocks;
    Guard(SessionLocks& registry, std::string sessionId, std::mutex& mutex);

    SessionLocks* m_registry;
    std::string m_sessionId;
    std::unique_lock<std::mutex> m_lock;
  };

  static SessionLocks& Process();

  Guard lock(const std::string& sessionId);

  /** @brief Number of sessions currently locked or waited for. */
  size_t size() const;

  private:
  struct Entry {
    std::mutex mutex;
    size_t users = 0;
  };

  void release(const std::string& sessionId);

  mutable std::mutex m_registryMutex;
  std::map<std::string, std::unique_ptr<Entry>> m_locks;
};
}
