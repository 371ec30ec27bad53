#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.hpp"

namespace gov::core {

/// Compares live protection snapshots against a partial desired policy.
/// Pure: no I/O. Diffs are emitted in a fixed setting order.
/// Class abbreviation: df
class Differ {
 public:
  /// Branch settings in evaluation order.
  static constexpr const char* kBranchSettings[] = {
      "required_reviews",           "dismiss_stale_reviews",
      "require_code_owner_reviews", "require_status_checks",
      "require_branches_up_to_date", "require_signed_commits",
      "enforce_admins"};

  static common::SyncDiffResult computeDiff(const common::RepoInfo& riRepo,
                                            const common::BranchProtectionSettings& bpsCurrent,
                                            const common::DesiredBranchProtection& dbpDesired);

  static common::TagProtectionDiffResult computeTagDiff(
      const common::RepoInfo& riRepo, const common::TagProtectionSettings& tpsCurrent,
      const common::DesiredTagProtection& dtpDesired);

  /// Render a diff value for display: "not set", "[]", "[a, b]" or the scalar.
  static std::string formatValue(const nlohmann::json& jValue);
};

}  // namespace gov::core
