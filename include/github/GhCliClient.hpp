#pragma once

#include <optional>
#include <string>

#include "github/IGitHubClient.hpp"

namespace gov::github {

/// IGitHubClient backed by the GitHub CLI (`gh api`).
/// Authentication is whatever `gh auth` has configured. Stateless, so
/// concurrent requests are safe.
/// Class abbreviation: gh
class GhCliClient : public IGitHubClient {
 public:
  explicit GhCliClient(std::string sGhPath);
  ~GhCliClient() override;

  bool isAvailable() override;
  nlohmann::json request(const std::string& sMethod, const std::string& sPath,
                         const std::optional<nlohmann::json>& ojBody) override;
  nlohmann::json viewRepo(const std::string& sProjectRoot) override;

  /// Extract the HTTP status from gh's error output ("... (HTTP 404)").
  /// Returns 0 when none is present.
  static int parseHttpStatus(const std::string& sStderr);

 private:
  std::string _sGhPath;
};

}  // namespace gov::github
