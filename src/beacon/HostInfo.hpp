#ifndef __SB_HOST_INFO__
#define __SB_HOST_INFO__

#include "Headers.hpp"

namespace sb {
/**
 * @brief Metadata the embedding application supplies for every report.
 */
class HostInfoProvider {
 public:
  virtual ~HostInfoProvider() = default;

  /** @brief Application name, used in the report URL. */
  virtual string getPluginName() = 0;

  virtual string getPluginVersion() = 0;

  /** @brief Version string of the environment the application runs in. */
  virtual string getServerVersion() = 0;

  /** @brief Live gauge, e.g. the number of connected users. */
  virtual int getPlayersOnline() = 0;

  /** @brief True if the host authenticates its users. */
  virtual bool isOnlineMode() = 0;
};

/**
 * @brief Facts about the machine and runtime the host runs on.
 */
struct EnvironmentInfo {
  string osName;
  string osArch;
  string osVersion;
  string runtimeVersion;
  int coreCount = 0;

  /** @brief Reads the facts from uname(2) and the C++ runtime. */
  static EnvironmentInfo detect();
};

class EnvironmentProvider {
 public:
  virtual ~EnvironmentProvider() = default;

  virtual EnvironmentInfo getEnvironment() = 0;
};

/**
 * @brief Detects the environment once and keeps returning the result.
 */
class SystemEnvironmentProvider : public EnvironmentProvider {
 public:
  SystemEnvironmentProvider();

  EnvironmentInfo getEnvironment() override { return info; }

 protected:
  EnvironmentInfo info;
};
}  // namespace sb

#endif  // __SB_HOST_INFO__
