#include "HttpReportTransport.hpp"

#include "GzipUtils.hpp"

namespace sb {
namespace {
void setTimeout(chrono::milliseconds timeout,
                const function<void(time_t, time_t)>& setter) {
  auto sec = chrono::duration_cast<chrono::seconds>(timeout);
  auto usec = chrono::duration_cast<chrono::microseconds>(timeout - sec);
  setter(static_cast<time_t>(sec.count()), static_cast<time_t>(usec.count()));
}
}  // namespace

optional<ProxySettings> parseProxyUrl(const string& url) {
  string rest = url;
  auto schemeEnd = rest.find("://");
  if (schemeEnd != string::npos) {
    rest = rest.substr(schemeEnd + 3);
  }
  auto pathStart = rest.find('/');
  if (pathStart != string::npos) {
    rest = rest.substr(0, pathStart);
  }

  ProxySettings proxy;
  auto at = rest.rfind('@');
  if (at != string::npos) {
    string credentials = rest.substr(0, at);
    rest = rest.substr(at + 1);
    auto colon = credentials.find(':');
    proxy.user = credentials.substr(0, colon);
    if (colon != string::npos) {
      proxy.password = credentials.substr(colon + 1);
    }
  }

  string portString;
  if (startsWith(rest, "[")) {
    // [v6 address]:port
    auto close = rest.find(']');
    if (close == string::npos) {
      return std::nullopt;
    }
    proxy.host = rest.substr(1, close - 1);
    if (close + 1 < rest.size() && rest[close + 1] == ':') {
      portString = rest.substr(close + 2);
    }
  } else {
    auto colon = rest.rfind(':');
    proxy.host = rest.substr(0, colon);
    if (colon != string::npos) {
      portString = rest.substr(colon + 1);
    }
  }
  if (proxy.host.empty()) {
    return std::nullopt;
  }
  if (!portString.empty()) {
    try {
      proxy.port = stoi(portString);
    } catch (const std::logic_error&) {
      LOG(WARNING) << "[Metrics] Ignoring invalid proxy port in " << url;
      return std::nullopt;
    }
  }
  return proxy;
}

string urlEncode(const string& text) {
  static const char hex[] = "0123456789ABCDEF";
  string encoded;
  encoded.reserve(text.size());
  for (char c : text) {
    unsigned char u = static_cast<unsigned char>(c);
    if (isalnum(u) || c == '.' || c == '-' || c == '*' || c == '_') {
      encoded.push_back(c);
    } else if (c == ' ') {
      encoded.push_back('+');
    } else {
      encoded.push_back('%');
      encoded.push_back(hex[u >> 4]);
      encoded.push_back(hex[u & 0x0F]);
    }
  }
  return encoded;
}

string buildReportPath(const string& pathTemplate, const string& pluginName) {
  string path = pathTemplate;
  replace(path, "%s", urlEncode(pluginName));
  return path;
}

optional<string> firstResponseLine(const string& body) {
  if (body.empty()) {
    return std::nullopt;
  }
  string line = body.substr(0, body.find('\n'));
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return line;
}

HttpReportTransport::HttpReportTransport(const MetricsOptions& _options)
    : options(_options) {}

httplib::Headers HttpReportTransport::buildHeaders(size_t compressedLength) {
  return httplib::Headers{
      {"User-Agent", "MCStats/" + to_string(REVISION)},
      {"Content-Encoding", "gzip"},
      {"Content-Length", to_string(compressedLength)},
      {"Accept", "application/json"},
      {"Connection", "close"},
  };
}

optional<ProxySettings> HttpReportTransport::systemProxy() const {
  if (options.bypassProxy) {
    return std::nullopt;
  }
  const char* proxyEnv = ::getenv("http_proxy");
  if (!proxyEnv || !proxyEnv[0]) {
    proxyEnv = ::getenv("HTTP_PROXY");
  }
  if (!proxyEnv || !proxyEnv[0]) {
    return std::nullopt;
  }
  return parseProxyUrl(proxyEnv);
}

optional<string> HttpReportTransport::submit(const string& pluginName,
                                             const string& payload,
                                             bool debug) {
  string compressed = gzipCompress(payload);
  string path = buildReportPath(options.reportPath, pluginName);

  httplib::Client client(options.baseUrl);
  setTimeout(options.connectionTimeout, [&client](time_t sec, time_t usec) {
    client.set_connection_timeout(sec, usec);
  });
  setTimeout(options.readTimeout, [&client](time_t sec, time_t usec) {
    client.set_read_timeout(sec, usec);
  });
  setTimeout(options.writeTimeout, [&client](time_t sec, time_t usec) {
    client.set_write_timeout(sec, usec);
  });
  client.set_keep_alive(false);

  auto proxy = systemProxy();
  if (proxy) {
    VLOG(1) << "Sending report through proxy " << proxy->host << ":"
            << proxy->port;
    client.set_proxy(proxy->host, proxy->port);
    if (!proxy->user.empty()) {
      client.set_proxy_basic_auth(proxy->user, proxy->password);
    }
  }

  if (debug) {
    LOG(INFO) << "[Metrics] Prepared request for " << pluginName
              << " uncompressed=" << payload.size()
              << " compressed=" << compressed.size();
  }

  auto res = client.Post(path, buildHeaders(compressed.size()), compressed,
                         "application/json");
  if (!res) {
    throw DeliveryError("Request to " + options.baseUrl + path +
                        " failed: " + httplib::to_string(res.error()));
  }
  if (res->status >= 400) {
    throw DeliveryError("Server returned HTTP response code: " +
                        to_string(res->status) + " for URL: " +
                        options.baseUrl + path);
  }
  return firstResponseLine(res->body);
}
}  // namespace sb
