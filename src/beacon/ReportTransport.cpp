#include "ReportTransport.hpp"

namespace sb {
const char* FIRST_UPDATE_PHRASE = "This is your first update this hour";

SubmitResult parseSubmitResponse(const optional<string>& responseLine) {
  if (!responseLine) {
    throw DeliveryError("null");
  }
  const string& response = *responseLine;
  if (startsWith(response, "ERR")) {
    throw DeliveryError(response);
  }
  if (startsWith(response, "7")) {
    // "7,<reason>" or "7<reason>"
    throw DeliveryError(response.substr(startsWith(response, "7,") ? 2 : 1));
  }
  if (response == "1" || response.find(FIRST_UPDATE_PHRASE) != string::npos) {
    return SubmitResult::FIRST_UPDATE_THIS_HOUR;
  }
  return SubmitResult::ACCEPTED;
}
}  // namespace sb
