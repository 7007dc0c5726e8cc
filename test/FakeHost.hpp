#ifndef __FAKE_HOST_HPP__
#define __FAKE_HOST_HPP__

#include "HostInfo.hpp"
#include "Plotter.hpp"

namespace sb {
class FakeHostInfo : public HostInfoProvider {
 public:
  FakeHostInfo()
      : pluginName("FakePlugin"),
        pluginVersion("2.3"),
        serverVersion("git-Fake-1 (MC: 1.7.2)"),
        playersOnline(3),
        onlineMode(true) {}

  string getPluginName() override { return pluginName; }
  string getPluginVersion() override { return pluginVersion; }
  string getServerVersion() override { return serverVersion; }
  int getPlayersOnline() override { return playersOnline; }
  bool isOnlineMode() override { return onlineMode; }

  string pluginName;
  string pluginVersion;
  string serverVersion;
  int playersOnline;
  bool onlineMode;
};

class FakeEnvironmentProvider : public EnvironmentProvider {
 public:
  FakeEnvironmentProvider() {
    info.osName = "Linux";
    info.osArch = "amd64";
    info.osVersion = "6.1.0";
    info.runtimeVersion = "1.7.0_51";
    info.coreCount = 8;
  }

  EnvironmentInfo getEnvironment() override { return info; }

  EnvironmentInfo info;
};

class CountingPlotter : public Plotter {
 public:
  CountingPlotter(const string& _name, int _value)
      : Plotter(_name), value(_value), resetCount(0) {}

  int getValue() override { return value; }

  void reset() override { resetCount++; }

  atomic<int> value;
  atomic<int> resetCount;
};
}  // namespace sb

#endif  // __FAKE_HOST_HPP__
