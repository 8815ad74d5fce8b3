#ifndef FLOTILLA_ORCHESTRATOR_CANCELLATION_HPP
#define FLOTILLA_ORCHESTRATOR_CANCELLATION_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace flot::orchestrator {
/** @brief Cancellable sleep shared between a waiting thread and whoever may
 * want to interrupt it. */
class Cancellation {
  public:
  void cancel() {
    {
      std::lock_guard lock(m_mutex);
      m_cancelled = true;
    }
    m_cv.notify_all();
  }

  bool cancelled() const {
    std::lock_guard lock(m_mutex);
    return m_cancelled;
  }

  /** @brief Sleeps for the duration. Returns true if cancelled meanwhile. */
  template<typename Rep, typename Period>
  bool sleepFor(std::chrono::duration<Rep, Period> duration) {
    std::unique_lock lock(m_mutex);
    return m_cv.wait_for(lock, duration, [this] { return m_cancelled; });
  }

  private:
  mutable std::mutex m_mutex;
  std::condition_variable m_cv;
  bool m_cancelled = false;
};
}

#endif
