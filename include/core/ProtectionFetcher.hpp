#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.hpp"
#include "github/IGitHubClient.hpp"

namespace gov::core {

/// Reads live branch/tag rulesets and maps them into protection snapshots.
/// Throws common::RemoteFetcherError (NO_REPO, NO_PERMISSION, API_ERROR).
/// Class abbreviation: pf
class ProtectionFetcher {
 public:
  static constexpr const char* kBranchRulesetName = "Branch Protection";
  static constexpr const char* kTagRulesetName = "Tag Protection";

  explicit ProtectionFetcher(github::IGitHubClient& ghClient);
  ~ProtectionFetcher();

  /// Resolve owner/repo of the checkout at sProjectRoot via `gh repo view`.
  common::RepoInfo getRepoInfo(const std::string& sProjectRoot);

  /// List all rulesets; a 404 yields an empty array. Entries returned by the
  /// list endpoint without rules are completed from the detail endpoint.
  nlohmann::json fetchRulesets(const common::RepoInfo& riRepo);

  common::BranchProtectionSettings fetchBranchProtection(const common::RepoInfo& riRepo,
                                                         const std::string& sBranch);

  common::TagProtectionSettings fetchTagProtection(const common::RepoInfo& riRepo);

  /// First active branch ruleset whose ref_name.include has refs/heads/<branch>.
  static std::optional<nlohmann::json> findBranchRuleset(const nlohmann::json& jRulesets,
                                                         const std::string& sBranch);

  /// Reverse-map a ruleset's rules. A missing rule or parameter stays nullopt.
  static common::BranchProtectionSettings parseBranchRuleset(
      const std::string& sBranch, const std::optional<nlohmann::json>& ojRuleset);

  /// Locate the "Tag Protection" tag ruleset and read its patterns and rules.
  static common::TagProtectionSettings parseTagRuleset(const nlohmann::json& jRulesets);

 private:
  github::IGitHubClient& _ghClient;
};

}  // namespace gov::core
