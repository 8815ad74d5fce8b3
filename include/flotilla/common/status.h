#ifndef FLOTILLA_COMMON_STATUS_H
#define FLOTILLA_COMMON_STATUS_H

#ifdef __cplusplus
extern "C" {
#endif

typedef enum flot_status {
  FLOT_OK,
  FLOT_PENDING,
  FLOT_TIMEOUT,
  FLOT_ABORTED,
  FLOT_INVALID_ARGUMENT,
  FLOT_NOT_FOUND,
  FLOT_NO_RUNNER,
  FLOT_MISSING_SESSION,
  FLOT_UNSUPPORTED_MODE,
  FLOT_ALREADY_EXISTS,
  FLOT_VERSION_CONFLICT,
  FLOT_PARSE_ERROR,
  FLOT_IO_ERROR,
  FLOT_PATH_NOT_FOUND_ERROR,
  FLOT_FILE_NOT_FOUND_ERROR,
  FLOT_SPAWN_ERROR,
  FLOT_GIT_ERROR,
  FLOT_GENERIC_ERROR
} flot_status;

const char*
flot_status_to_str(flot_status status);

#ifdef __cplusplus
}

#include <iostream>

inline std::ostream&
operator<<(std::ostream& o, flot_status status) {
  return o << flot_status_to_str(status);
}
#endif

#endif
