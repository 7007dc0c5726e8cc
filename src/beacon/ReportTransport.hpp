#ifndef __SB_REPORT_TRANSPORT__
#define __SB_REPORT_TRANSPORT__

#include "Headers.hpp"

namespace sb {
/**
 * @brief A report was not accepted, or never reached the server.  The
 * message carries the detail the server sent back.
 */
class DeliveryError : public std::runtime_error {
 public:
  explicit DeliveryError(const string& what) : std::runtime_error(what) {}
};

enum class SubmitResult {
  /** @brief Accepted, nothing else to do. */
  ACCEPTED,
  /** @brief Accepted as the first update of the server aggregation window. */
  FIRST_UPDATE_THIS_HOUR,
};

/** @brief Server phrase meaning this was the first update of the window. */
extern const char* FIRST_UPDATE_PHRASE;

/**
 * @brief Interprets the first response line of the collection server.
 *
 * @param responseLine nullopt if the server sent nothing.
 * @throws DeliveryError for no response, "ERR..." or "7..." answers.
 */
SubmitResult parseSubmitResponse(const optional<string>& responseLine);

/**
 * @brief Delivers one report document to the collection server.
 */
class ReportTransport {
 public:
  virtual ~ReportTransport() = default;

  /**
   * @brief Sends `payload` on behalf of `pluginName`.
   * @param debug log request details at INFO level.
   * @return The first line of the response, or nullopt if there was none.
   * @throws DeliveryError or std::runtime_error on network failure.
   */
  virtual optional<string> submit(const string& pluginName,
                                  const string& payload, bool debug) = 0;
};
}  // namespace sb

#endif  // __SB_REPORT_TRANSPORT__
