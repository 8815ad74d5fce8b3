#ifndef FLOTILLA_STATE_STATE_DOCUMENT_STORE_HPP
#define FLOTILLA_STATE_STATE_DOCUMENT_STORE_HPP

#include <string>

#include "flotilla/common/status.h"
#include "flotilla/state/orchestration_state.hpp"

namespace flot::state {
/** @brief Durable per-session storage of the orchestration document.
 *
 * Documents are always read and written as a whole.
 */
class StateDocumentStore {
  public:
  virtual ~StateDocumentStore() = default;

  /** @brief Reads the document of a session. An unknown session yields an
   * empty document with version 0 and FLOT_OK. */
  virtual flot_status get(const std::string& sessionId,
                          OrchestrationState& state) = 0;

  /** @brief Writes the document if state.version still matches the stored
   * version, then increments state.version. Otherwise nothing is written and
   * FLOT_VERSION_CONFLICT is returned. */
  virtual flot_status save(const std::string& sessionId,
                           OrchestrationState& state) = 0;
};
}

#endif
