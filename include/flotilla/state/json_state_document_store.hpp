#ifndef FLOTILLA_STATE_JSON_STATE_DOCUMENT_STORE_HPP
#define FLOTILLA_STATE_JSON_STATE_DOCUMENT_STORE_HPP

#include <boost/filesystem/path.hpp>

#include "flotilla/state/state_document_store.hpp"

namespace flot::state {
/** @brief Stores each session document as <directory>/<session>.json.
 *
 * Saves hold an exclusive lock on <session>.json.lock from reading the stored
 * version until the new document is renamed into place, so concurrent
 * writers in other threads or processes cannot both pass the version check.
 */
class JsonStateDocumentStore : public StateDocumentStore {
  public:
  explicit JsonStateDocumentStore(boost::filesystem::path directory);
  virtual ~JsonStateDocumentStore();

  flot_status get(const std::string& sessionId,
                  OrchestrationState& state) override;
  flot_status save(const std::string& sessionId,
                   OrchestrationState& state) override;

  boost::filesystem::path pathOf(const std::string& sessionId) const;
  boost::filesystem::path lockPathOf(const std::string& sessionId) const;

  private:
  static bool ValidSessionId(const std::string& sessionId);
  flot_status saveLocked(const std::string& sessionId,
                         OrchestrationState& state);

  boost::filesystem::path m_directory;
};
}

#endif
