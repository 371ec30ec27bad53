#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace gov::common {

/// GitHub repository identity.
/// Class abbreviation: ri
struct RepoInfo {
  std::string sOwner;
  std::string sRepo;

  bool operator==(const RepoInfo&) const = default;
};

/// Actor allowed to bypass a ruleset.
/// Class abbreviation: ba
struct BypassActor {
  int64_t iActorId = 0;
  std::string sActorType;
  std::string sBypassMode;

  bool operator==(const BypassActor&) const = default;
};

/// Branch protection as currently configured on the remote.
/// std::nullopt means "not configured", distinct from false / empty.
/// Class abbreviation: bps
struct BranchProtectionSettings {
  std::string sBranch;
  std::optional<int> oRequiredReviews;
  std::optional<bool> oDismissStaleReviews;
  std::optional<bool> oRequireCodeOwnerReviews;
  std::optional<std::vector<std::string>> oRequiredStatusChecks;
  std::optional<bool> oRequireBranchesUpToDate;
  std::optional<bool> oRequireSignedCommits;
  std::optional<bool> oEnforceAdmins;
  std::optional<std::vector<BypassActor>> oBypassActors;
  std::optional<int64_t> oRulesetId;
  std::optional<std::string> oRulesetName;

  bool operator==(const BranchProtectionSettings&) const = default;
};

/// Branch protection policy. An absent field is not managed.
/// Class abbreviation: dbp
struct DesiredBranchProtection {
  std::optional<std::string> oBranch;
  std::optional<int> oRequiredReviews;
  std::optional<bool> oDismissStaleReviews;
  std::optional<bool> oRequireCodeOwnerReviews;
  std::optional<std::vector<std::string>> oRequireStatusChecks;
  std::optional<bool> oRequireBranchesUpToDate;
  std::optional<bool> oRequireSignedCommits;
  std::optional<bool> oEnforceAdmins;
};

/// Diff action type.
enum class DiffAction { Add, Change };

inline const char* toString(DiffAction action) {
  return action == DiffAction::Add ? "add" : "change";
}

/// A single setting difference. Values are null, bool, int or string arrays.
/// Class abbreviation: sd
struct SettingDiff {
  std::string sSetting;
  nlohmann::json jCurrent;
  nlohmann::json jDesired;
  DiffAction action = DiffAction::Add;

  bool operator==(const SettingDiff&) const = default;
};

/// Result of comparing current vs. desired branch protection.
/// Class abbreviation: sdr
struct SyncDiffResult {
  RepoInfo riRepo;
  std::string sBranch;
  std::vector<SettingDiff> vDiffs;
  bool bHasChanges = false;
  std::optional<int64_t> oCurrentRulesetId;
};

/// A diff that could not be applied.
/// Class abbreviation: fd
struct FailedDiff {
  SettingDiff sdDiff;
  std::string sError;
};

/// Result of applying a diff.
/// Class abbreviation: sr
struct SyncResult {
  bool bSuccess = false;
  std::vector<SettingDiff> vApplied;
  std::vector<FailedDiff> vFailed;
};

/// Tag protection as currently configured on the remote.
/// Class abbreviation: tps
struct TagProtectionSettings {
  std::vector<std::string> vPatterns;
  bool bPreventDeletion = false;
  bool bPreventUpdate = false;
  std::optional<int64_t> oRulesetId;
  std::optional<std::string> oRulesetName;
};

/// Tag protection policy. Absent fields are not managed when diffing; when
/// applied, patterns default to ["v*"] and both flags default to true.
/// Class abbreviation: dtp
struct DesiredTagProtection {
  std::optional<std::vector<std::string>> oPatterns;
  std::optional<bool> oPreventDeletion;
  std::optional<bool> oPreventUpdate;
};

/// Result of comparing current vs. desired tag protection.
/// Class abbreviation: tdr
struct TagProtectionDiffResult {
  RepoInfo riRepo;
  std::vector<SettingDiff> vDiffs;
  bool bHasChanges = false;
  std::optional<int64_t> oCurrentRulesetId;
};

/// A single policy violation reported by a check.
/// Class abbreviation: vi
struct Violation {
  std::string sRule;
  std::string sTool;
  std::optional<std::string> oFile;
  std::optional<int> oLine;
  std::string sMessage;
  std::string sSeverity = "error";  // "error" | "warning"
};

/// Outcome of a single check, shared with the reporting layer.
/// Class abbreviation: cr
struct CheckResult {
  std::string sName;
  std::string sRule;
  bool bPassed = true;
  bool bSkipped = false;
  std::optional<std::string> oSkipReason;
  std::vector<Violation> vViolations;
  int64_t iDurationMs = 0;
};

/// Remote file requirement; alternatives are probed in order.
/// Class abbreviation: rfc
struct RemoteFileCheckConfig {
  std::string sPath;
  std::vector<std::string> vAlternativePaths;
  bool bRequired = false;
  std::string sDescription;
};

/// Outcome of probing one RemoteFileCheckConfig.
/// Class abbreviation: rfr
struct RemoteFileCheckResult {
  std::string sPath;
  bool bExists = false;
  std::vector<std::string> vCheckedPaths;

  bool operator==(const RemoteFileCheckResult&) const = default;
};

/// Aggregate counters of a scan.
/// Class abbreviation: ss
struct ScanSummary {
  int iTotalChecks = 0;
  int iPassedChecks = 0;
  int iFailedChecks = 0;
  int iSkippedChecks = 0;
};

/// Result of a read-only repository scan.
/// Class abbreviation: scr
struct ScanResult {
  RepoInfo riRepo;
  std::vector<CheckResult> vChecks;
  bool bPassed = true;
  ScanSummary summary;
};

/// Result of tier/ruleset validation.
/// Class abbreviation: tvr
struct TierValidationResult {
  bool bValid = false;
  std::string sTier;
  std::string sTierSource;        // "repo-metadata.yaml" | "default"
  std::string sTierSourceDetail;  // e.g. "default (file not found)"
  std::vector<std::string> vRulesets;
  std::string sExpectedPattern;
  std::vector<std::string> vMatchedRulesets;
  std::optional<std::string> oError;
  std::vector<std::string> vWarnings;
  bool bHasEmptyRulesets = false;
  std::optional<std::string> oRegistryUrl;
  std::optional<std::string> oInvalidTierValue;
};

/// Summary of a GitHub ruleset as listed by the rulesets endpoint.
/// Class abbreviation: rs
struct RulesetSummary {
  int64_t iId = 0;
  std::string sName;
  std::string sTarget;
  std::string sEnforcement;
  std::optional<std::vector<std::string>> oBranches;
};

/// Classic (pre-ruleset) branch protection of one branch.
/// Class abbreviation: cbp
struct ClassicBranchProtection {
  std::string sBranch;
  std::optional<int> oRequiredReviews;
  std::optional<bool> oDismissStaleReviews;
  std::optional<bool> oRequireCodeOwnerReviews;
  std::optional<std::vector<std::string>> oStatusCheckContexts;
  std::optional<bool> oStrict;
  std::optional<bool> oEnforceAdmins;
  std::optional<bool> oRequireSignatures;
};

/// Classic rule that overlaps a branch ruleset.
/// Class abbreviation: pc
struct ProtectionConflict {
  ClassicBranchProtection cbpClassic;
  RulesetSummary rsRuleset;
};

/// Classic rules and rulesets side by side.
/// Class abbreviation: pp
struct ProtectionPlan {
  std::vector<RulesetSummary> vRulesets;
  std::vector<ClassicBranchProtection> vClassicRules;
  std::vector<ClassicBranchProtection> vOrphaned;
  std::vector<ProtectionConflict> vConflicts;
};

}  // namespace gov::common
