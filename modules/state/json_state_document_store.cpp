#include <algorithm>
#include <cctype>
#include <fstream>
#include <mutex>

#include <boost/filesystem/operations.hpp>
#include <boost/interprocess/exceptions.hpp>
#include <boost/interprocess/sync/file_lock.hpp>
#include <boost/interprocess/sync/scoped_lock.hpp>

#include <flotilla/common/log.h>
#include <flotilla/state/json_state_document_store.hpp>
#include <flotilla/util/json_file.hpp>

namespace flot::state {
namespace {
// Record locks are held per process and do not exclude threads of the same
// process, which may also use separate store instances.
std::mutex&
ProcessSaveMutex() {
  static std::mutex mutex;
  return mutex;
}
}

JsonStateDocumentStore::JsonStateDocumentStore(
  boost::filesystem::path directory)
  : m_directory(std::move(directory)) {}
JsonStateDocumentStore::~JsonStateDocumentStore() {}

bool
JsonStateDocumentStore::ValidSessionId(const std::string& sessionId) {
  if(sessionId.empty() || sessionId == "." || sessionId == "..")
    return false;
  return std::all_of(sessionId.begin(), sessionId.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' ||
           c == '_' || c == '.';
  });
}

boost::filesystem::path
JsonStateDocumentStore::pathOf(const std::string& sessionId) const {
  return m_directory / (sessionId + ".json");
}

boost::filesystem::path
JsonStateDocumentStore::lockPathOf(const std::string& sessionId) const {
  return m_directory / (sessionId + ".json.lock");
}

flot_status
JsonStateDocumentStore::get(const std::string& sessionId,
                            OrchestrationState& state) {
  if(!ValidSessionId(sessionId))
    return FLOT_INVALID_ARGUMENT;

  // Documents are replaced by rename, readers never see a partial one.
  OrchestrationState loaded;
  flot_status s = util::LoadJson(pathOf(sessionId), "state", loaded);
  if(s == FLOT_FILE_NOT_FOUND_ERROR) {
    state = OrchestrationState{};
    return FLOT_OK;
  }
  if(s != FLOT_OK)
    return s;

  state = std::move(loaded);
  return FLOT_OK;
}

flot_status
JsonStateDocumentStore::save(const std::string& sessionId,
                             OrchestrationState& state) {
  if(!ValidSessionId(sessionId))
    return FLOT_INVALID_ARGUMENT;

  std::lock_guard processLock(ProcessSaveMutex());

  boost::system::error_code ec;
  boost::filesystem::create_directories(m_directory, ec);
  const auto lockPath = lockPathOf(sessionId);
  {
    // file_lock requires an existing file.
    std::ofstream touch(lockPath.string(), std::ios::app);
    if(!touch) {
      flot_log(FLOT_STATE,
               FLOT_LOCALERROR,
               "Could not create lock file {}",
               lockPath.string());
      return FLOT_IO_ERROR;
    }
  }

  try {
    boost::interprocess::file_lock fileLock(lockPath.c_str());
    boost::interprocess::scoped_lock<boost::interprocess::file_lock> guard(
      fileLock);
    return saveLocked(sessionId, state);
  } catch(const boost::interprocess::interprocess_exception& e) {
    flot_log(FLOT_STATE,
             FLOT_LOCALERROR,
             "Could not lock {}: {}",
             lockPath.string(),
             e.what());
    return FLOT_IO_ERROR;
  }
}

flot_status
JsonStateDocumentStore::saveLocked(const std::string& sessionId,
                                   OrchestrationState& state) {
  OrchestrationState stored;
  flot_status s = util::LoadJson(pathOf(sessionId), "state", stored);
  if(s != FLOT_OK && s != FLOT_FILE_NOT_FOUND_ERROR)
    return s;

  if(stored.version != state.version) {
    flot_log(FLOT_STATE,
             FLOT_LOCALWARNING,
             "Refusing to save state of session {}: based on version {}, "
             "stored version is {}",
             sessionId,
             state.version,
             stored.version);
    return FLOT_VERSION_CONFLICT;
  }

  OrchestrationState next = state;
  ++next.version;
  s = util::SaveJson(pathOf(sessionId), "state", next);
  if(s != FLOT_OK)
    return s;

  state.version = next.version;
  flot_log(FLOT_STATE,
           FLOT_TRACE,
           "Saved state of session {} as version {}",
           sessionId,
           state.version);
  return FLOT_OK;
}
}
