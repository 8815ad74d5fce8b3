#include <flotilla/common/status.h>

#include <flot_common_export.h>

FLOT_COMMON_EXPORT const char*
flot_status_to_str(flot_status status) {
  switch(status) {
    case FLOT_OK:
      return "ok";
    case FLOT_PENDING:
      return "pending";
    case FLOT_TIMEOUT:
      return "timeout";
    case FLOT_ABORTED:
      return "aborted";
    case FLOT_INVALID_ARGUMENT:
      return "invalid argument";
    case FLOT_NOT_FOUND:
      return "not found";
    case FLOT_NO_RUNNER:
      return "no agent runner";
    case FLOT_MISSING_SESSION:
      return "missing session";
    case FLOT_UNSUPPORTED_MODE:
      return "unsupported mode";
    case FLOT_ALREADY_EXISTS:
      return "already exists";
    case FLOT_VERSION_CONFLICT:
      return "version conflict";
    case FLOT_PARSE_ERROR:
      return "parse error";
    case FLOT_IO_ERROR:
      return "io error";
    case FLOT_PATH_NOT_FOUND_ERROR:
      return "path not found";
    case FLOT_FILE_NOT_FOUND_ERROR:
      return "file not found";
    case FLOT_SPAWN_ERROR:
      return "spawn error";
    case FLOT_GIT_ERROR:
      return "git error";
    case FLOT_GENERIC_ERROR:
      return "generic error";
  }
  return "unknown status";
}
