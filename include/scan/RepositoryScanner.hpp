#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Policy.hpp"
#include "common/Types.hpp"
#include "core/ProtectionFetcher.hpp"
#include "core/ThreadPool.hpp"
#include "github/IGitHubClient.hpp"
#include "scan/RemoteFetcher.hpp"

namespace gov::scan {

/// Read-only compliance scan of a remote repository against a Policy.
/// Verification failures (NO_GH, INVALID_REPO, NO_REPO, NO_PERMISSION,
/// API_ERROR) propagate as common::RemoteFetcherError; everything found after
/// verification is reported as check violations.
/// Class abbreviation: rsc
class RepositoryScanner {
 public:
  static constexpr const char* kRepoRule = "process.repo";
  static constexpr const char* kFilesRule = "process.scan.files";
  static constexpr const char* kTagRule = "process.tag_protection";

  RepositoryScanner(github::IGitHubClient& ghClient, core::ThreadPool& tpPool);
  ~RepositoryScanner();

  common::ScanResult scanRepository(const std::string& sRepoSlug, const common::Policy& pol);

 private:
  /// Rulesets, or why they could not be read. Read at most once per scan.
  struct RulesetRead {
    nlohmann::json jRulesets = nlohmann::json::array();
    std::optional<std::string> oError;
    bool bForbidden = false;
  };

  RulesetRead readRulesets(const common::RepoInfo& riRepo);

  common::CheckResult checkRepository(const common::RepoInfo& riRepo, const common::Policy& pol,
                                      const RulesetRead& rr);
  common::CheckResult checkFiles(const common::RepoInfo& riRepo, const common::Policy& pol);
  common::CheckResult checkTagProtection(const common::RepoInfo& riRepo,
                                         const common::DesiredTagProtection& dtpDesired,
                                         const RulesetRead& rr);

  RemoteFetcher _rfFetcher;
  core::ProtectionFetcher _pfFetcher;
};

}  // namespace gov::scan
