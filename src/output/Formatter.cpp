#include "output/Formatter.hpp"

#include "common/Errors.hpp"
#include "core/Differ.hpp"

#include <sstream>
#include <vector>

namespace gov::output {

namespace {

constexpr const char* kPass = "✓";
constexpr const char* kFail = "✗";
constexpr const char* kSkip = "○";
constexpr size_t kMaxViolationsShown = 10;

std::string join(const std::vector<std::string>& vItems) {
  std::string sOut;
  for (size_t i = 0; i < vItems.size(); ++i) {
    if (i > 0) sOut += ", ";
    sOut += vItems[i];
  }
  return sOut;
}

template <typename T>
nlohmann::json optionalJson(const std::optional<T>& oValue) {
  return oValue ? nlohmann::json(*oValue) : nlohmann::json(nullptr);
}

nlohmann::json repoJson(const common::RepoInfo& riRepo) {
  return {{"owner", riRepo.sOwner}, {"repo", riRepo.sRepo}};
}

void appendDiffLines(std::ostringstream& oss, const std::vector<common::SettingDiff>& vDiffs) {
  for (const auto& sd : vDiffs) {
    oss << "  " << (sd.action == common::DiffAction::Add ? '+' : '~') << " " << sd.sSetting
        << ": " << core::Differ::formatValue(sd.jCurrent) << " -> "
        << core::Differ::formatValue(sd.jDesired) << "\n";
  }
}

std::string violationLine(const common::Violation& vi) {
  std::string sLine = "      ";
  if (vi.oFile) {
    sLine += *vi.oFile + ":" + std::to_string(vi.oLine.value_or(0)) + " ";
  }
  sLine += (vi.sSeverity == "error" ? "error" : "warn");
  sLine += " [" + vi.sRule + "] " + vi.sMessage;
  return sLine;
}

}  // namespace

OutputFormat parseOutputFormat(const std::string& sFormat) {
  if (sFormat == "text") return OutputFormat::Text;
  if (sFormat == "json") return OutputFormat::Json;
  throw common::ConfigError("Unknown output format '" + sFormat + "' (expected text or json)");
}

Formatter::Formatter(OutputFormat ofFormat) : _ofFormat(ofFormat) {}

// ── JSON ──────────────────────────────────────────────────────────────────

nlohmann::json Formatter::toJson(const common::SettingDiff& sd) {
  return {{"setting", sd.sSetting},
          {"current", sd.jCurrent},
          {"desired", sd.jDesired},
          {"action", common::toString(sd.action)}};
}

nlohmann::json Formatter::toJson(const common::SyncDiffResult& sdr) {
  nlohmann::json jDiffs = nlohmann::json::array();
  for (const auto& sd : sdr.vDiffs) jDiffs.push_back(toJson(sd));
  return {{"repoInfo", repoJson(sdr.riRepo)},
          {"branch", sdr.sBranch},
          {"diffs", jDiffs},
          {"hasChanges", sdr.bHasChanges},
          {"currentRulesetId", optionalJson(sdr.oCurrentRulesetId)}};
}

nlohmann::json Formatter::toJson(const common::TagProtectionDiffResult& tdr) {
  nlohmann::json jDiffs = nlohmann::json::array();
  for (const auto& sd : tdr.vDiffs) jDiffs.push_back(toJson(sd));
  return {{"repoInfo", repoJson(tdr.riRepo)},
          {"diffs", jDiffs},
          {"hasChanges", tdr.bHasChanges},
          {"currentRulesetId", optionalJson(tdr.oCurrentRulesetId)}};
}

nlohmann::json Formatter::toJson(const common::SyncResult& sr) {
  nlohmann::json jApplied = nlohmann::json::array();
  for (const auto& sd : sr.vApplied) jApplied.push_back(toJson(sd));
  nlohmann::json jFailed = nlohmann::json::array();
  for (const auto& fd : sr.vFailed) {
    auto jEntry = toJson(fd.sdDiff);
    jEntry["error"] = fd.sError;
    jFailed.push_back(jEntry);
  }
  return {{"success", sr.bSuccess}, {"applied", jApplied}, {"failed", jFailed}};
}

nlohmann::json Formatter::toJson(const common::CheckResult& cr) {
  nlohmann::json jViolations = nlohmann::json::array();
  for (const auto& vi : cr.vViolations) {
    jViolations.push_back({{"rule", vi.sRule},
                           {"tool", vi.sTool},
                           {"file", optionalJson(vi.oFile)},
                           {"line", optionalJson(vi.oLine)},
                           {"message", vi.sMessage},
                           {"severity", vi.sSeverity}});
  }
  return {{"name", cr.sName},
          {"rule", cr.sRule},
          {"passed", cr.bPassed},
          {"skipped", cr.bSkipped},
          {"skipReason", optionalJson(cr.oSkipReason)},
          {"violations", jViolations},
          {"duration", cr.iDurationMs}};
}

nlohmann::json Formatter::toJson(const common::ScanResult& scr) {
  nlohmann::json jChecks = nlohmann::json::array();
  for (const auto& cr : scr.vChecks) jChecks.push_back(toJson(cr));
  return {{"repoInfo", repoJson(scr.riRepo)},
          {"checks", jChecks},
          {"passed", scr.bPassed},
          {"summary",
           {{"totalChecks", scr.summary.iTotalChecks},
            {"passedChecks", scr.summary.iPassedChecks},
            {"failedChecks", scr.summary.iFailedChecks},
            {"skippedChecks", scr.summary.iSkippedChecks}}}};
}

nlohmann::json Formatter::toJson(const common::TierValidationResult& tvr) {
  nlohmann::json j = {{"valid", tvr.bValid},
                      {"tier", tvr.sTier},
                      {"tierSource", tvr.sTierSource},
                      {"tierSourceDetail", tvr.sTierSourceDetail},
                      {"rulesets", tvr.vRulesets},
                      {"expectedPattern", tvr.sExpectedPattern},
                      {"matchedRulesets", tvr.vMatchedRulesets},
                      {"warnings", tvr.vWarnings},
                      {"hasEmptyRulesets", tvr.bHasEmptyRulesets}};
  if (tvr.oError) j["error"] = *tvr.oError;
  if (tvr.oRegistryUrl) j["registryUrl"] = *tvr.oRegistryUrl;
  if (tvr.oInvalidTierValue) j["invalidTierValue"] = *tvr.oInvalidTierValue;
  return j;
}

nlohmann::json Formatter::toJson(const core::CleanupOutcome& co) {
  const auto& pp = co.ppPlan;
  auto classicJson = [](const common::ClassicBranchProtection& cbp) {
    return nlohmann::json{{"branch", cbp.sBranch},
                          {"requiredReviews", optionalJson(cbp.oRequiredReviews)},
                          {"dismissStaleReviews", optionalJson(cbp.oDismissStaleReviews)},
                          {"requireCodeOwnerReviews", optionalJson(cbp.oRequireCodeOwnerReviews)},
                          {"statusCheckContexts", optionalJson(cbp.oStatusCheckContexts)},
                          {"strict", optionalJson(cbp.oStrict)},
                          {"enforceAdmins", optionalJson(cbp.oEnforceAdmins)},
                          {"requireSignatures", optionalJson(cbp.oRequireSignatures)}};
  };
  auto rulesetJson = [](const common::RulesetSummary& rs) {
    return nlohmann::json{{"id", rs.iId},
                          {"name", rs.sName},
                          {"target", rs.sTarget},
                          {"enforcement", rs.sEnforcement},
                          {"branches", optionalJson(rs.oBranches)}};
  };

  nlohmann::json jRulesets = nlohmann::json::array();
  for (const auto& rs : pp.vRulesets) jRulesets.push_back(rulesetJson(rs));
  nlohmann::json jClassic = nlohmann::json::array();
  for (const auto& cbp : pp.vClassicRules) jClassic.push_back(classicJson(cbp));
  nlohmann::json jOrphaned = nlohmann::json::array();
  for (const auto& cbp : pp.vOrphaned) jOrphaned.push_back(classicJson(cbp));
  nlohmann::json jConflicts = nlohmann::json::array();
  for (const auto& pc : pp.vConflicts) {
    jConflicts.push_back({{"classic", classicJson(pc.cbpClassic)},
                          {"ruleset", rulesetJson(pc.rsRuleset)}});
  }

  return {{"rulesets", jRulesets},
          {"classicRules", jClassic},
          {"orphaned", jOrphaned},
          {"conflicts", jConflicts},
          {"applied", co.bApplied},
          {"removed", co.vRemoved}};
}

// ── Text ──────────────────────────────────────────────────────────────────

std::string Formatter::diff(const common::SyncDiffResult& sdr) const {
  if (_ofFormat == OutputFormat::Json) return toJson(sdr).dump(2);

  std::ostringstream oss;
  oss << "Repository: " << sdr.riRepo.sOwner << "/" << sdr.riRepo.sRepo << "\n";
  oss << "Branch: " << sdr.sBranch << "\n";
  if (!sdr.bHasChanges) {
    oss << "No changes needed. Branch protection is in sync.";
    return oss.str();
  }
  oss << "Changes (" << sdr.vDiffs.size() << "):\n";
  appendDiffLines(oss, sdr.vDiffs);
  std::string sOut = oss.str();
  sOut.pop_back();
  return sOut;
}

std::string Formatter::tagDiff(const common::TagProtectionDiffResult& tdr) const {
  if (_ofFormat == OutputFormat::Json) return toJson(tdr).dump(2);

  std::ostringstream oss;
  oss << "Repository: " << tdr.riRepo.sOwner << "/" << tdr.riRepo.sRepo << "\n";
  if (!tdr.bHasChanges) {
    oss << "No changes needed. Tag protection is in sync.";
    return oss.str();
  }
  oss << "Tag protection changes (" << tdr.vDiffs.size() << "):\n";
  appendDiffLines(oss, tdr.vDiffs);
  std::string sOut = oss.str();
  sOut.pop_back();
  return sOut;
}

std::string Formatter::sync(const common::SyncResult& sr) const {
  if (_ofFormat == OutputFormat::Json) return toJson(sr).dump(2);

  std::ostringstream oss;
  if (sr.bSuccess) {
    if (sr.vApplied.empty()) {
      return "No changes applied.";
    }
    oss << kPass << " Applied " << sr.vApplied.size() << " change(s)";
    for (const auto& sd : sr.vApplied) {
      oss << "\n  " << sd.sSetting << ": " << core::Differ::formatValue(sd.jDesired);
    }
    return oss.str();
  }
  oss << kFail << " Failed to apply " << sr.vFailed.size() << " change(s)";
  for (const auto& fd : sr.vFailed) {
    oss << "\n  " << fd.sdDiff.sSetting << ": " << fd.sError;
  }
  return oss.str();
}

std::string Formatter::scan(const common::ScanResult& scr) const {
  if (_ofFormat == OutputFormat::Json) return toJson(scr).dump(2);

  std::ostringstream oss;
  oss << "Scan: " << scr.riRepo.sOwner << "/" << scr.riRepo.sRepo << "\n";
  for (const auto& cr : scr.vChecks) {
    const std::string sDuration =
        cr.iDurationMs > 0 ? " (" + std::to_string(cr.iDurationMs) + "ms)" : "";
    if (cr.bSkipped) {
      oss << "  " << kSkip << " " << cr.sName << ": skipped - " << cr.oSkipReason.value_or("")
          << sDuration << "\n";
      continue;
    }
    if (cr.bPassed && cr.vViolations.empty()) {
      oss << "  " << kPass << " " << cr.sName << ": passed" << sDuration << "\n";
      continue;
    }
    oss << "  " << (cr.bPassed ? kPass : kFail) << " " << cr.sName << ": "
        << cr.vViolations.size() << " violation(s)" << sDuration << "\n";
    for (size_t i = 0; i < cr.vViolations.size() && i < kMaxViolationsShown; ++i) {
      oss << violationLine(cr.vViolations[i]) << "\n";
    }
    if (cr.vViolations.size() > kMaxViolationsShown) {
      oss << "      ... and " << cr.vViolations.size() - kMaxViolationsShown << " more\n";
    }
  }

  oss << "\n";
  if (scr.bPassed) {
    oss << kPass << " All checks passed";
  } else {
    oss << kFail << " " << scr.summary.iFailedChecks << " of " << scr.summary.iTotalChecks
        << " check(s) failed";
  }
  oss << " (" << scr.summary.iPassedChecks << " passed, " << scr.summary.iFailedChecks
      << " failed, " << scr.summary.iSkippedChecks << " skipped)";
  return oss.str();
}

std::string Formatter::tier(const common::TierValidationResult& tvr) const {
  if (_ofFormat == OutputFormat::Json) return toJson(tvr).dump(2);

  std::ostringstream oss;
  if (tvr.bValid) {
    oss << kPass << " Tier validation passed\n";
    oss << "  Tier: " << tvr.sTier << " (source: " << tvr.sTierSourceDetail << ")";
    if (!tvr.vMatchedRulesets.empty()) {
      oss << "\n  Matching rulesets: " << join(tvr.vMatchedRulesets);
    } else {
      oss << "\n  No extends configured (no tier constraint)";
    }
  } else {
    oss << kFail << " Tier validation failed\n";
    oss << "  Tier: " << tvr.sTier << " (source: " << tvr.sTierSourceDetail << ")\n";
    oss << "  Expected pattern: " << tvr.sExpectedPattern << "\n";
    oss << "  Rulesets: [" << join(tvr.vRulesets) << "]";
    if (tvr.oError) {
      oss << "\n  Error: " << *tvr.oError;
    }
  }
  for (const auto& sWarning : tvr.vWarnings) {
    oss << "\n  Warning: " << sWarning;
  }
  return oss.str();
}

std::string Formatter::formatProtectionPlan(const common::ProtectionPlan& pp) {
  std::ostringstream oss;
  oss << "=== GitHub Rulesets ===\n";
  if (pp.vRulesets.empty()) {
    oss << "  (none)\n";
  }
  for (const auto& rs : pp.vRulesets) {
    oss << "  [" << rs.iId << "] " << rs.sName << " (" << rs.sTarget << ", " << rs.sEnforcement
        << ") -> " << (rs.oBranches ? join(*rs.oBranches) : "(all)") << "\n";
  }

  oss << "\n=== Classic Branch Protection ===\n";
  if (pp.vClassicRules.empty()) {
    oss << "  (none)\n";
  }
  for (const auto& cbp : pp.vClassicRules) {
    oss << "  " << cbp.sBranch << ": " << cbp.oRequiredReviews.value_or(0)
        << " reviews required\n";
  }

  if (!pp.vConflicts.empty()) {
    oss << "\n=== Conflicts (both classic and ruleset protect same branch) ===\n";
    for (const auto& pc : pp.vConflicts) {
      oss << "  " << pc.cbpClassic.sBranch << ": classic + ruleset \"" << pc.rsRuleset.sName
          << "\"\n";
    }
  }

  if (!pp.vOrphaned.empty()) {
    oss << "\n=== Orphaned Classic Rules (can be safely removed) ===\n";
    for (const auto& cbp : pp.vOrphaned) {
      oss << "  " << cbp.sBranch << "\n";
    }
  }

  std::string sOut = oss.str();
  sOut.pop_back();
  return sOut;
}

std::string Formatter::cleanup(const core::CleanupOutcome& co) const {
  if (_ofFormat == OutputFormat::Json) return toJson(co).dump(2);

  const auto& pp = co.ppPlan;
  if (pp.vOrphaned.empty() && pp.vConflicts.empty()) {
    return "No classic branch protection rules to clean up.";
  }

  std::ostringstream oss;
  if (!co.bApplied) {
    oss << "Preview mode (use --apply to actually remove rules)\n\n";
    oss << formatProtectionPlan(pp) << "\n";
    oss << "\nRun with --apply to remove orphaned and conflicting classic rules.";
    return oss.str();
  }

  for (const auto& sBranch : co.vRemoved) {
    oss << "Removed classic protection from branch: " << sBranch << "\n";
  }
  oss << "\nRemoved " << co.vRemoved.size() << " classic branch protection rule(s).";
  return oss.str();
}

}  // namespace gov::output
