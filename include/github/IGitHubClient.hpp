#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace gov::github {

/// Pure abstract interface for the GitHub API transport.
/// Implementations throw common::GitHubApiError on any failed request.
class IGitHubClient {
 public:
  virtual ~IGitHubClient() = default;

  /// Probe whether the transport can be used at all. Never throws.
  virtual bool isAvailable() = 0;

  /// Issue an API request. sPath is relative, e.g. "repos/o/r/rulesets".
  /// Returns the parsed response body (null for an empty body).
  virtual nlohmann::json request(const std::string& sMethod, const std::string& sPath,
                                 const std::optional<nlohmann::json>& ojBody) = 0;

  /// Resolve the repository of a local checkout. Returns {"owner":{"login"},"name"}.
  virtual nlohmann::json viewRepo(const std::string& sProjectRoot) = 0;
};

}  // namespace gov::github
