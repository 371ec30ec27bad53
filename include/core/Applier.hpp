#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.hpp"
#include "github/IGitHubClient.hpp"

namespace gov::core {

/// Pushes desired protection onto GitHub as a whole ruleset (create or
/// replace). A diff result without changes never reaches the client.
/// Throws common::ApplierError("NO_PERMISSION") on 403; every other failure is
/// returned in SyncResult::vFailed.
/// Class abbreviation: ap
class Applier {
 public:
  explicit Applier(github::IGitHubClient& ghClient);
  ~Applier();

  common::SyncResult applyBranchProtection(const common::RepoInfo& riRepo,
                                           const std::string& sBranch,
                                           const common::DesiredBranchProtection& dbpDesired,
                                           const common::SyncDiffResult& sdrDiff);

  common::SyncResult applyTagProtection(const common::RepoInfo& riRepo,
                                        const common::DesiredTagProtection& dtpDesired,
                                        const common::TagProtectionDiffResult& tdrDiff);

  /// Full ruleset request body for a branch; every desired setting is included,
  /// not only the diffed ones, because the API replaces the whole ruleset.
  static nlohmann::json buildBranchRulesetBody(const std::string& sBranch,
                                               const common::DesiredBranchProtection& dbpDesired);

  static nlohmann::json buildTagRulesetBody(const common::DesiredTagProtection& dtpDesired);

 private:
  /// POST a new ruleset or PUT over an existing one; classifies failures.
  common::SyncResult submit(const common::RepoInfo& riRepo, const std::optional<int64_t>& oId,
                            const nlohmann::json& jBody,
                            const std::vector<common::SettingDiff>& vDiffs,
                            const std::string& sWhat);

  github::IGitHubClient& _ghClient;
};

}  // namespace gov::core
