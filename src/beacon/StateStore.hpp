#ifndef __SB_STATE_STORE__
#define __SB_STATE_STORE__

#include "Headers.hpp"

namespace sb {
/**
 * @brief The three persisted settings of the metrics client.
 */
struct PersistedState {
  /** @brief Stable random identifier.  Empty until the first run. */
  string guid;
  bool optOut = false;
  bool debug = false;
};

/**
 * @brief Raised when the backing document cannot be read or is corrupt.
 */
class StateStoreError : public std::runtime_error {
 public:
  explicit StateStoreError(const string& what) : std::runtime_error(what) {}
};

/**
 * @brief Key-value document holding the PersistedState.
 *
 * The store may be edited by an operator while the client runs, so callers
 * re-load it whenever they need the opt-out flag.
 */
class StateStore {
 public:
  virtual ~StateStore() = default;

  /** @brief True if a document was saved before. */
  virtual bool exists() const = 0;

  /**
   * @brief Reads the document.
   * @throws StateStoreError if it is missing, unreadable or corrupt.
   */
  virtual PersistedState load() = 0;

  /**
   * @brief Writes the document.
   * @throws StateStoreError if it cannot be written.
   */
  virtual void save(const PersistedState& state) = 0;

  /** @brief Human readable location of the document. */
  virtual string location() const = 0;
};
}  // namespace sb

#endif  // __SB_STATE_STORE__
