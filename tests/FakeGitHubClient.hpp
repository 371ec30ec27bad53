#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Errors.hpp"
#include "github/IGitHubClient.hpp"

namespace gov::test {

/// One request seen by FakeGitHubClient.
struct RecordedCall {
  std::string sMethod;
  std::string sPath;
  std::optional<nlohmann::json> ojBody;
};

/// In-memory IGitHubClient. Requests are answered by fnHandler (null body
/// when unset) and recorded in order. Safe for concurrent use.
class FakeGitHubClient : public github::IGitHubClient {
 public:
  using Handler = std::function<nlohmann::json(const std::string& sMethod,
                                               const std::string& sPath,
                                               const std::optional<nlohmann::json>& ojBody)>;

  bool bAvailable = true;
  Handler fnHandler;
  nlohmann::json jViewRepo = {{"owner", {{"login", "acme"}}}, {"name", "widgets"}};

  bool isAvailable() override { return bAvailable; }

  nlohmann::json request(const std::string& sMethod, const std::string& sPath,
                         const std::optional<nlohmann::json>& ojBody) override {
    {
      std::lock_guard<std::mutex> lock(_mtx);
      _vCalls.push_back({sMethod, sPath, ojBody});
    }
    if (!fnHandler) {
      return nullptr;
    }
    return fnHandler(sMethod, sPath, ojBody);
  }

  nlohmann::json viewRepo(const std::string& /*sProjectRoot*/) override {
    if (jViewRepo.is_null()) {
      throw common::GitHubApiError(0, "not a git repository");
    }
    return jViewRepo;
  }

  std::vector<RecordedCall> calls() const {
    std::lock_guard<std::mutex> lock(_mtx);
    return _vCalls;
  }

  size_t callCount() const {
    std::lock_guard<std::mutex> lock(_mtx);
    return _vCalls.size();
  }

  bool wasCalled(const std::string& sMethod, const std::string& sPath) const {
    std::lock_guard<std::mutex> lock(_mtx);
    for (const auto& rc : _vCalls) {
      if (rc.sMethod == sMethod && rc.sPath == sPath) return true;
    }
    return false;
  }

 private:
  mutable std::mutex _mtx;
  std::vector<RecordedCall> _vCalls;
};

/// Shorthand for a failed request with an HTTP status.
inline common::GitHubApiError httpError(int iStatus, const std::string& sBody = "") {
  return common::GitHubApiError(iStatus, "HTTP " + std::to_string(iStatus) + ": " + sBody);
}

}  // namespace gov::test
