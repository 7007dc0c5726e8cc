#ifndef __SB_HTTP_REPORT_TRANSPORT__
#define __SB_HTTP_REPORT_TRANSPORT__

#include "Headers.hpp"
#include "MetricsOptions.hpp"
#include "ReportTransport.hpp"

namespace sb {
/** @brief Proxy parsed from an `http_proxy` style url. */
struct ProxySettings {
  string host;
  int port = 80;
  string user;
  string password;
};

/**
 * @brief Parses `[scheme://][user[:password]@]host[:port][/...]`.
 * @return nullopt if no host can be found.
 */
optional<ProxySettings> parseProxyUrl(const string& url);

/**
 * @brief application/x-www-form-urlencoded encoding: alphanumerics and
 * `.-*_` are kept, space becomes `+`, every other byte is `%XX`.
 */
string urlEncode(const string& text);

/** @brief Replaces `%s` in `pathTemplate` with the encoded plugin name. */
string buildReportPath(const string& pathTemplate, const string& pluginName);

/**
 * @brief First line of a response body without its line terminator, or
 * nullopt for an empty body.
 */
optional<string> firstResponseLine(const string& body);

/**
 * @brief Posts gzip compressed reports with cpp-httplib.
 *
 * A new connection is opened for every report and closed afterwards.
 */
class HttpReportTransport : public ReportTransport {
 public:
  explicit HttpReportTransport(const MetricsOptions& _options);

  optional<string> submit(const string& pluginName, const string& payload,
                          bool debug) override;

  /** @brief Request headers for a compressed body of the given size. */
  static httplib::Headers buildHeaders(size_t compressedLength);

 protected:
  /** @brief Proxy from the environment, unless proxies are bypassed. */
  optional<ProxySettings> systemProxy() const;

  MetricsOptions options;
};
}  // namespace sb

#endif  // __SB_HTTP_REPORT_TRANSPORT__
