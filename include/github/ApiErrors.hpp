#pragma once

#include <exception>
#include <string>

#include "common/Errors.hpp"

namespace gov::github {

/// HTTP status carried by a failed request, 0 when unknown.
inline int httpStatusOf(const std::exception& ex) {
  if (const auto* pApi = dynamic_cast<const common::GitHubApiError*>(&ex)) {
    return pApi->_iHttpStatus;
  }
  return 0;
}

/// A known status decides on its own. Without one, only gh's own markers
/// count; digits elsewhere in the message (ids, repo names) never do.
inline bool hasStatus(const std::exception& ex, int iStatus, const char* pExtraMarker) {
  const int iKnown = httpStatusOf(ex);
  if (iKnown != 0) {
    return iKnown == iStatus;
  }
  const std::string sMsg = ex.what();
  if (sMsg.find("HTTP " + std::to_string(iStatus)) != std::string::npos) {
    return true;
  }
  return pExtraMarker != nullptr && sMsg.find(pExtraMarker) != std::string::npos;
}

/// True for 403 responses.
inline bool isForbidden(const std::exception& ex) {
  return hasStatus(ex, 403, "Must have admin rights");
}

/// True for 404 responses.
inline bool isNotFound(const std::exception& ex) {
  return hasStatus(ex, 404, nullptr);
}

}  // namespace gov::github
