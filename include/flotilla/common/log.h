#ifndef FLOTILLA_COMMON_LOG_H
#define FLOTILLA_COMMON_LOG_H

#include "flotilla/common/status.h"

#ifdef __cplusplus
extern "C" {
#endif

enum flot_log_severity {
  FLOT_TRACE,
  FLOT_DEBUG,
  FLOT_INFO,
  FLOT_LOCALWARNING,
  FLOT_LOCALERROR,
  FLOT_GLOBALWARNING,
  FLOT_GLOBALERROR,
  FLOT_FATAL,
  FLOT_SEVERITY_COUNT
};

enum flot_log_channel {
  FLOT_GENERAL,
  FLOT_TASKS,
  FLOT_WORKTREE,
  FLOT_GIT,
  FLOT_SPAWNER,
  FLOT_STATE,
  FLOT_RECONCILER,
  FLOT_MERGE,
  FLOT_WAIT,
  FLOT_ORCHESTRATOR,
  FLOT_CHANNEL_COUNT
};

flot_status
flot_log_init();

void
flot_log_set_severity(enum flot_log_severity severity);

void
flot_log_set_channel_active(enum flot_log_channel channel, bool active);

void
flot_log_set_local_name(const char* name);

const char*
flot_log_severity_to_str(enum flot_log_severity severity);

const char*
flot_log_channel_to_str(enum flot_log_channel channel);

void
flot_log(enum flot_log_channel channel,
         enum flot_log_severity severity,
         const char* msg);

bool
flot_log_enabled(enum flot_log_channel channel,
                 enum flot_log_severity severity);

#ifdef __cplusplus
}
#include <ostream>
#include <string_view>

void
flot_log(flot_log_channel channel,
         flot_log_severity severity,
         std::string_view msg);

inline std::ostream&
operator<<(std::ostream& o, flot_log_severity severity) {
  return o << flot_log_severity_to_str(severity);
}
inline std::ostream&
operator<<(std::ostream& o, flot_log_channel channel) {
  return o << flot_log_channel_to_str(channel);
}

#include <fmt/format.h>
#include <fmt/ostream.h>

/** @brief Formats the message with fmt and only does so if the channel and
 * severity are enabled.
 *
 * Format errors are reported in place of the message, they never escape the
 * logging call.
 */
template<typename... Args>
void
flot_log(flot_log_channel channel,
         flot_log_severity severity,
         fmt::format_string<Args...> fmt,
         Args&&... args) {
  if(!flot_log_enabled(channel, severity))
    return;
  try {
    fmt::memory_buffer buf;
    fmt::format_to(std::back_inserter(buf), fmt, std::forward<Args>(args)...);
    flot_log(channel, severity, std::string_view(buf.data(), buf.size()));
  } catch(const fmt::format_error& e) {
    flot_log(channel, severity, std::string_view(e.what()));
  }
}
#endif

#endif
