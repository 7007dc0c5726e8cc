#include "HostInfo.hpp"

namespace sb {
EnvironmentInfo EnvironmentInfo::detect() {
  EnvironmentInfo info;
  struct utsname name;
  if (::uname(&name) == 0) {
    info.osName = name.sysname;
    info.osArch = name.machine;
    info.osVersion = name.release;
  } else {
    LOG(WARNING) << "uname failed: " << strerror(errno);
    info.osName = "unknown";
    info.osArch = "unknown";
    info.osVersion = "unknown";
  }
#if defined(__VERSION__)
  info.runtimeVersion = __VERSION__;
#else
  info.runtimeVersion = to_string(__cplusplus);
#endif
  info.coreCount = static_cast<int>(std::thread::hardware_concurrency());
  if (info.coreCount <= 0) {
    long onlineCpus = ::sysconf(_SC_NPROCESSORS_ONLN);
    info.coreCount = onlineCpus > 0 ? static_cast<int>(onlineCpus) : 1;
  }
  return info;
}

SystemEnvironmentProvider::SystemEnvironmentProvider()
    : info(EnvironmentInfo::detect()) {
  VLOG(1) << "Environment: " << info.osName << " " << info.osArch << " "
          << info.osVersion << " cores=" << info.coreCount;
}
}  // namespace sb
