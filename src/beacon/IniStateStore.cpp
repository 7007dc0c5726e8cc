#include "IniStateStore.hpp"

namespace sb {
const char* IniStateStore::SECTION = "Metrics";

IniStateStore::IniStateStore(const string& _path)
    : path(_path), ini(true, false, false) {
  CHECK(!path.empty()) << "Metrics config path must not be empty";
}

string IniStateStore::defaultLocation() {
  return sago::getConfigHome() + "/PluginMetrics/config.ini";
}

bool IniStateStore::exists() const {
  std::error_code ec;
  return fs::exists(path, ec);
}

PersistedState IniStateStore::load() {
  lock_guard<mutex> guard(storeMutex);
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    throw StateStoreError("Metrics config does not exist: " + path);
  }

  ini.Reset();
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw StateStoreError("Invalid config file: " + path + " (error " +
                          to_string(rc) + ")");
  }

  PersistedState state;
  const char* guid = ini.GetValue(SECTION, "guid", NULL);
  if (guid) {
    state.guid = guid;
  }
  state.optOut = readBool("opt-out", false);
  state.debug = readBool("debug", false);
  return state;
}

void IniStateStore::save(const PersistedState& state) {
  lock_guard<mutex> guard(storeMutex);
  if (ini.GetSectionSize(SECTION) < 0) {
    ini.SetValue(SECTION, NULL, NULL, "; http://mcstats.org");
  }
  ini.SetBoolValue(SECTION, "opt-out", state.optOut);
  ini.SetValue(SECTION, "guid", state.guid.c_str());
  ini.SetBoolValue(SECTION, "debug", state.debug);

  std::error_code ec;
  auto parent = fs::path(path).parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent, ec);
    if (ec) {
      throw StateStoreError("Cannot create config directory " +
                            parent.string() + ": " + ec.message());
    }
  }

  string tmpPath = path + ".tmp";
  SI_Error rc = ini.SaveFile(tmpPath.c_str());
  if (rc < 0) {
    throw StateStoreError("Cannot write config file: " + tmpPath +
                          " (error " + to_string(rc) + ")");
  }
  fs::rename(tmpPath, path, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmpPath, ignored);
    throw StateStoreError("Cannot replace config file " + path + ": " +
                          ec.message());
  }
  VLOG(1) << "Saved metrics config to " << path;
}

bool IniStateStore::readBool(const char* key, bool defaultValue) {
  const char* raw = ini.GetValue(SECTION, key, NULL);
  if (!raw) {
    return defaultValue;
  }
  string value(raw);
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (value == "true" || value == "yes" || value == "on" || value == "1") {
    return true;
  }
  if (value == "false" || value == "no" || value == "off" || value == "0") {
    return false;
  }
  throw StateStoreError("Invalid value for " + string(key) + " in " + path +
                        ": " + raw);
}
}  // namespace sb
