#ifndef __SB_METRICS_OPTIONS__
#define __SB_METRICS_OPTIONS__

#include "Headers.hpp"

namespace sb {
/**
 * @brief Host supplied settings of a metrics client.  None of these are
 * persisted; the persisted settings live in the StateStore.
 */
struct MetricsOptions {
  /** @brief Scheme and host of the collection server. */
  string baseUrl = DEFAULT_BASE_URL;
  /** @brief Request path, `%s` is replaced by the url-encoded app name. */
  string reportPath = DEFAULT_REPORT_PATH;
  int pingIntervalMinutes = PING_INTERVAL;
  /** @brief Never send reports through the http_proxy of the environment. */
  bool bypassProxy = false;
  chrono::milliseconds connectionTimeout = chrono::seconds(5);
  chrono::milliseconds readTimeout = chrono::seconds(10);
  chrono::milliseconds writeTimeout = chrono::seconds(10);
};
}  // namespace sb

#endif  // __SB_METRICS_OPTIONS__
