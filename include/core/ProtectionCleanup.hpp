#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Types.hpp"
#include "github/IGitHubClient.hpp"

namespace gov::core {

/// Result of a cleanup run. vRemoved lists branches whose classic protection
/// was deleted; it stays empty in preview mode.
/// Class abbreviation: co
struct CleanupOutcome {
  common::ProtectionPlan ppPlan;
  bool bApplied = false;
  std::vector<std::string> vRemoved;
};

/// Finds classic (pre-ruleset) branch protection that is orphaned or shadowed
/// by a ruleset, and removes it on request.
/// Throws common::CleanupError (NO_PERMISSION, API_ERROR, NOT_FOUND).
/// Class abbreviation: pcl
class ProtectionCleanup {
 public:
  explicit ProtectionCleanup(github::IGitHubClient& ghClient);
  ~ProtectionCleanup();

  static std::vector<std::string> defaultBranches();

  /// Rulesets plus classic protection of each branch, queried one at a time.
  common::ProtectionPlan listAllProtection(const common::RepoInfo& riRepo,
                                           const std::vector<std::string>& vBranches);

  void removeClassicProtection(const common::RepoInfo& riRepo, const std::string& sBranch);

  /// Preview (bApply false) or remove orphaned and conflicting classic rules.
  CleanupOutcome runCleanup(const common::RepoInfo& riRepo,
                            const std::vector<std::string>& vBranches, bool bApply);

  /// Classify classic rules against branch rulesets.
  static void classify(common::ProtectionPlan& ppPlan);

 private:
  std::vector<common::RulesetSummary> fetchRulesetSummaries(const common::RepoInfo& riRepo);
  std::optional<common::ClassicBranchProtection> fetchClassic(const common::RepoInfo& riRepo,
                                                              const std::string& sBranch);

  github::IGitHubClient& _ghClient;
};

}  // namespace gov::core
