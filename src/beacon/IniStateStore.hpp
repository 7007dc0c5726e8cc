#ifndef __SB_INI_STATE_STORE__
#define __SB_INI_STATE_STORE__

#include "Headers.hpp"
#include "SimpleIni.h"
#include "StateStore.hpp"

namespace sb {
/**
 * @brief StateStore backed by an ini file.
 *
 * The document looks like:
 *
 *     ; http://mcstats.org
 *     [Metrics]
 *     opt-out = false
 *     guid = 7f0c...
 *     debug = false
 *
 * Keys this class does not know about are preserved when it saves.  Saves
 * write a sibling temporary file and rename it over the document, so a
 * concurrent reader sees either the old or the new version.
 */
class IniStateStore : public StateStore {
 public:
  static const char* SECTION;

  explicit IniStateStore(const string& _path);

  /** @brief `<user config home>/PluginMetrics/config.ini` */
  static string defaultLocation();

  bool exists() const override;

  PersistedState load() override;

  void save(const PersistedState& state) override;

  string location() const override { return path; }

 protected:
  bool readBool(const char* key, bool defaultValue);

  string path;
  /** @brief Serializes loads and saves of this store. */
  mutex storeMutex;
  /** @brief Last document read from disk. */
  CSimpleIniA ini;
};
}  // namespace sb

#endif  // __SB_INI_STATE_STORE__
