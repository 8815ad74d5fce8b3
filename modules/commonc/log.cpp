#include <flotilla/common/log.h>
#include <flotilla/common/status.h>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/attributes/constant.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/expressions/predicates/has_attr.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

#include <array>
#include <cstdlib>
#include <iostream>
#include <string_view>

#include <flot_common_export.h>

using LoggerMT =
  boost::log::sources::severity_channel_logger_mt<flot_log_severity,
                                                  flot_log_channel>;

static boost::shared_ptr<boost::log::sinks::synchronous_sink<
  boost::log::sinks::basic_text_ostream_backend<char>>>
  global_console_sink;

static LoggerMT global_logger(boost::log::keywords::channel = FLOT_GENERAL);

static flot_log_severity global_severity = FLOT_INFO;
static std::array<bool, FLOT_CHANNEL_COUNT> global_channels = [] {
  std::array<bool, FLOT_CHANNEL_COUNT> channels;
  channels.fill(true);
  return channels;
}();

static std::string local_name;

using namespace boost::log;

BOOST_LOG_ATTRIBUTE_KEYWORD(flot_logger_timestamp,
                            "TimeStamp",
                            boost::posix_time::ptime)
BOOST_LOG_ATTRIBUTE_KEYWORD(flot_logger_thread,
                            "ThreadID",
                            attributes::current_thread_id::value_type)

FLOT_COMMON_EXPORT flot_status
flot_log_init() {
  static bool initialized = false;

  if(!initialized) {
    try {
      add_common_attributes();

      global_console_sink = add_console_log(std::clog);
      global_console_sink->set_formatter(
        expressions::stream
        << "c ["
        << expressions::if_(expressions::has_attr<std::string>(
             "LocalName"))[expressions::stream
                           << expressions::attr<std::string>("LocalName")]
        << "] [" << flot_logger_timestamp << "] ["
        << expressions::attr<flot_log_severity>("Severity") << "] ["
        << expressions::attr<flot_log_channel>("Channel") << " @ T"
        << flot_logger_thread << "] " << expressions::smessage);
      boost::log::core::get()->add_sink(global_console_sink);
    } catch(std::exception& e) {
      std::cerr << "> Exception during log setup! Message: " << e.what()
                << std::endl;
      return FLOT_GENERIC_ERROR;
    }
  }

  if(std::getenv("FLOT_LOG_DEBUG")) {
    flot_log_set_severity(FLOT_DEBUG);
  }
  if(std::getenv("FLOT_LOG_TRACE")) {
    flot_log_set_severity(FLOT_TRACE);
  }

  initialized = true;

  return FLOT_OK;
}

FLOT_COMMON_EXPORT void
flot_log_set_severity(flot_log_severity severity) {
  global_severity = severity;
}

FLOT_COMMON_EXPORT void
flot_log_set_channel_active(flot_log_channel channel, bool active) {
  global_channels[channel] = active;
}

FLOT_COMMON_EXPORT void
flot_log_set_local_name(const char* name) {
  local_name = name;
  if(local_name.size() > 0) {
    global_logger.add_attribute("LocalName",
                                attributes::make_constant(local_name));
  }
}

FLOT_COMMON_EXPORT void
flot_log(flot_log_channel channel,
         flot_log_severity severity,
         const char* msg) {
  flot_log(channel, severity, std::string_view(msg));
}

FLOT_COMMON_EXPORT void
flot_log(flot_log_channel channel,
         flot_log_severity severity,
         std::string_view msg) {
  if(flot_log_enabled(channel, severity)) {
    try {
      BOOST_LOG_CHANNEL_SEV(global_logger, channel, severity) << msg;
    } catch(std::exception& e) {
      std::cerr
        << "!! Could not print log entry because of exception! Message: "
        << e.what() << std::endl;
    }
  }
}

FLOT_COMMON_EXPORT bool
flot_log_enabled(flot_log_channel channel, flot_log_severity severity) {
  return severity >= global_severity && global_channels[channel];
}

FLOT_COMMON_EXPORT const char*
flot_log_severity_to_str(flot_log_severity severity) {
  switch(severity) {
    case FLOT_TRACE:
      return "TRCE";
    case FLOT_DEBUG:
      return "DEBG";
    case FLOT_INFO:
      return "INFO";
    case FLOT_LOCALWARNING:
      return "LWRN";
    case FLOT_LOCALERROR:
      return "LERR";
    case FLOT_GLOBALWARNING:
      return "GWRN";
    case FLOT_GLOBALERROR:
      return "GERR";
    case FLOT_FATAL:
      return "FTAL";

    case FLOT_SEVERITY_COUNT:
      break;
  }
  return "!!!!";
}

FLOT_COMMON_EXPORT const char*
flot_log_channel_to_str(flot_log_channel channel) {
  switch(channel) {
    case FLOT_GENERAL:
      return "General";
    case FLOT_TASKS:
      return "Tasks";
    case FLOT_WORKTREE:
      return "Worktree";
    case FLOT_GIT:
      return "Git";
    case FLOT_SPAWNER:
      return "Spawner";
    case FLOT_STATE:
      return "State";
    case FLOT_RECONCILER:
      return "Reconciler";
    case FLOT_MERGE:
      return "Merge";
    case FLOT_WAIT:
      return "Wait";
    case FLOT_ORCHESTRATOR:
      return "Orchestrator";
    case FLOT_CHANNEL_COUNT:
      break;
  }
  return "!";
}
