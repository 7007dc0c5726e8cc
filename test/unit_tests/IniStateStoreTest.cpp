#include "IniStateStore.hpp"
#include "TestHeaders.hpp"

using namespace sb;

namespace {
string readFile(const string& path) {
  ifstream in(path);
  stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void writeFile(const string& path, const string& contents) {
  fs::create_directories(fs::path(path).parent_path());
  ofstream out(path);
  out << contents;
}
}  // namespace

TEST_CASE("IniStateStore", "[IniStateStore]") {
  string dir = GetTempDirectory() + "sb_ini_" + sole::uuid4().str();
  string path = dir + "/PluginMetrics/config.ini";
  IniStateStore store(path);
  REQUIRE(store.location() == path);

  SECTION("Missing document") {
    REQUIRE_FALSE(store.exists());
    REQUIRE_THROWS_AS(store.load(), StateStoreError);
  }

  SECTION("Save creates the directory and reloads") {
    PersistedState state;
    state.guid = "1c2d3e4f-0000-4000-8000-123456789abc";
    state.optOut = true;
    store.save(state);
    REQUIRE(store.exists());
    REQUIRE_FALSE(fs::exists(path + ".tmp"));

    IniStateStore other(path);
    PersistedState loaded = other.load();
    REQUIRE(loaded.guid == state.guid);
    REQUIRE(loaded.optOut);
    REQUIRE_FALSE(loaded.debug);

    string contents = readFile(path);
    REQUIRE(contents.find("[Metrics]") != string::npos);
    REQUIRE(contents.find("mcstats.org") != string::npos);
  }

  SECTION("Hand edited document") {
    writeFile(path,
              "[Metrics]\n"
              "opt-out = YES\n"
              "guid = abc\n"
              "debug = on\n");
    PersistedState loaded = store.load();
    REQUIRE(loaded.guid == "abc");
    REQUIRE(loaded.optOut);
    REQUIRE(loaded.debug);
  }

  SECTION("Missing keys take defaults") {
    writeFile(path, "[Metrics]\n");
    PersistedState loaded = store.load();
    REQUIRE(loaded.guid.empty());
    REQUIRE_FALSE(loaded.optOut);
    REQUIRE_FALSE(loaded.debug);
  }

  SECTION("Invalid flag is an error") {
    writeFile(path,
              "[Metrics]\n"
              "opt-out = maybe\n"
              "guid = abc\n");
    REQUIRE(store.exists());
    REQUIRE_THROWS_AS(store.load(), StateStoreError);
  }

  SECTION("Unknown keys survive a save") {
    writeFile(path,
              "[Metrics]\n"
              "opt-out = false\n"
              "guid = abc\n"
              "debug = false\n"
              "color = blue\n"
              "[Other]\n"
              "answer = 42\n");
    PersistedState loaded = store.load();
    loaded.optOut = true;
    store.save(loaded);

    string contents = readFile(path);
    REQUIRE(contents.find("color") != string::npos);
    REQUIRE(contents.find("answer") != string::npos);
    REQUIRE(store.load().optOut);
  }

  std::error_code ec;
  fs::remove_all(dir, ec);
}
