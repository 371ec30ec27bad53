#include "scan/RepositoryScanner.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/Differ.hpp"

#include <algorithm>
#include <chrono>

namespace gov::scan {

namespace {

constexpr const char* kTool = "scan";

common::Violation makeViolation(std::string sRule, std::string sMessage,
                                std::string sSeverity = "error") {
  common::Violation vi;
  vi.sRule = std::move(sRule);
  vi.sTool = kTool;
  vi.sMessage = std::move(sMessage);
  vi.sSeverity = std::move(sSeverity);
  return vi;
}

/// A check fails only on error-severity violations.
void settle(common::CheckResult& cr, std::chrono::steady_clock::time_point tpStart) {
  cr.bPassed = std::none_of(cr.vViolations.begin(), cr.vViolations.end(),
                            [](const common::Violation& vi) { return vi.sSeverity == "error"; });
  cr.iDurationMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - tpStart)
                       .count();
}

std::string joinPaths(const std::vector<std::string>& vPaths) {
  std::string sOut;
  for (size_t i = 0; i < vPaths.size(); ++i) {
    if (i > 0) sOut += ", ";
    sOut += vPaths[i];
  }
  return sOut;
}

void addDiffViolations(common::CheckResult& cr, const std::string& sRulePrefix,
                       const std::string& sSubject,
                       const std::vector<common::SettingDiff>& vDiffs) {
  for (const auto& sd : vDiffs) {
    cr.vViolations.push_back(makeViolation(
        sRulePrefix + "." + sd.sSetting,
        sSubject + " " + sd.sSetting + ": expected " + core::Differ::formatValue(sd.jDesired) +
            ", found " + core::Differ::formatValue(sd.jCurrent)));
  }
}

/// Policy that reads rulesets in the repository check.
bool repoCheckNeedsRulesets(const common::Policy& pol) {
  return pol.rpRepo.bEnabled && (pol.rpRepo.bRequireBranchProtection || pol.rpRepo.oRuleset);
}

}  // namespace

RepositoryScanner::RepositoryScanner(github::IGitHubClient& ghClient, core::ThreadPool& tpPool)
    : _rfFetcher(ghClient, tpPool), _pfFetcher(ghClient) {}

RepositoryScanner::~RepositoryScanner() = default;

RepositoryScanner::RulesetRead RepositoryScanner::readRulesets(const common::RepoInfo& riRepo) {
  RulesetRead rr;
  try {
    rr.jRulesets = _pfFetcher.fetchRulesets(riRepo);
  } catch (const common::RemoteFetcherError& ex) {
    common::Logger::get()->warn("Reading rulesets of {}/{} failed: {}", riRepo.sOwner,
                                riRepo.sRepo, ex.what());
    rr.oError = ex.what();
    rr.bForbidden = ex._sErrorCode == "NO_PERMISSION";
  }
  return rr;
}

common::CheckResult RepositoryScanner::checkRepository(const common::RepoInfo& riRepo,
                                                       const common::Policy& pol,
                                                       const RulesetRead& rr) {
  const auto tpStart = std::chrono::steady_clock::now();
  common::CheckResult cr;
  cr.sName = "Repository";
  cr.sRule = kRepoRule;

  const auto& rp = pol.rpRepo;
  if (!rp.bEnabled) {
    cr.bSkipped = true;
    cr.oSkipReason = "Repository checks not enabled";
    return cr;
  }

  if (repoCheckNeedsRulesets(pol)) {
    const std::string sBranch = pol.branch();
    const std::string sRule = std::string(kRepoRule) + ".branch_protection";
    if (rr.oError) {
      // Rulesets are readable only with admin rights; treat that as inconclusive
      cr.vViolations.push_back(
          makeViolation(sRule, *rr.oError, rr.bForbidden ? "warning" : "error"));
    } else {
      const auto ojRuleset = core::ProtectionFetcher::findBranchRuleset(rr.jRulesets, sBranch);
      if (!ojRuleset && rp.bRequireBranchProtection) {
        cr.vViolations.push_back(makeViolation(
            sRule, "Branch '" + sBranch + "' does not have branch protection enabled"));
      } else if (rp.oRuleset) {
        const auto bpsCurrent = core::ProtectionFetcher::parseBranchRuleset(sBranch, ojRuleset);
        const auto sdr = core::Differ::computeDiff(riRepo, bpsCurrent, *rp.oRuleset);
        addDiffViolations(cr, sRule, "Branch '" + sBranch + "'", sdr.vDiffs);
      }
    }
  }

  settle(cr, tpStart);
  return cr;
}

common::CheckResult RepositoryScanner::checkFiles(const common::RepoInfo& riRepo,
                                                  const common::Policy& pol) {
  const auto tpStart = std::chrono::steady_clock::now();
  common::CheckResult cr;
  cr.sName = "Repository Files";
  cr.sRule = kFilesRule;

  const bool bRequireCodeowners = pol.rpRepo.bEnabled && pol.rpRepo.bRequireCodeowners;
  const auto vConfigs = RemoteFetcher::standardFileChecks(bRequireCodeowners);
  const auto vResults = _rfFetcher.checkRemoteFiles(riRepo, vConfigs);

  for (size_t i = 0; i < vConfigs.size(); ++i) {
    const auto& rfc = vConfigs[i];
    const auto& rfr = vResults[i];
    if (rfr.bExists || !rfc.bRequired) {
      continue;
    }
    auto vi = makeViolation(std::string(kFilesRule) + "." + rfc.sPath,
                            rfc.sDescription + " not found (checked: " +
                                joinPaths(rfr.vCheckedPaths) + ")");
    vi.oFile = rfc.sPath;
    cr.vViolations.push_back(std::move(vi));
  }

  settle(cr, tpStart);
  return cr;
}

common::CheckResult RepositoryScanner::checkTagProtection(
    const common::RepoInfo& riRepo, const common::DesiredTagProtection& dtpDesired,
    const RulesetRead& rr) {
  const auto tpStart = std::chrono::steady_clock::now();
  common::CheckResult cr;
  cr.sName = "Tag Protection";
  cr.sRule = kTagRule;

  if (rr.oError) {
    cr.vViolations.push_back(
        makeViolation(kTagRule, *rr.oError, rr.bForbidden ? "warning" : "error"));
  } else {
    const auto tpsCurrent = core::ProtectionFetcher::parseTagRuleset(rr.jRulesets);
    if (!tpsCurrent.oRulesetId) {
      cr.vViolations.push_back(
          makeViolation(kTagRule, "No tag protection ruleset is configured"));
    }
    const auto tdr = core::Differ::computeTagDiff(riRepo, tpsCurrent, dtpDesired);
    addDiffViolations(cr, kTagRule, "Tag protection", tdr.vDiffs);
  }

  settle(cr, tpStart);
  return cr;
}

common::ScanResult RepositoryScanner::scanRepository(const std::string& sRepoSlug,
                                                     const common::Policy& pol) {
  auto spLog = common::Logger::get();

  if (!_rfFetcher.isGhAvailable()) {
    throw common::RemoteFetcherError("NO_GH", "GitHub CLI (gh) not available");
  }
  const auto riRepo = RemoteFetcher::parseRepoString(sRepoSlug);
  _rfFetcher.verifyRepoAccess(riRepo);
  spLog->debug("Scanning {}/{}", riRepo.sOwner, riRepo.sRepo);

  common::ScanResult scr;
  scr.riRepo = riRepo;
  RulesetRead rr;
  if (repoCheckNeedsRulesets(pol) || pol.oTagProtection) {
    rr = readRulesets(riRepo);
  }
  scr.vChecks.push_back(checkRepository(riRepo, pol, rr));
  scr.vChecks.push_back(checkFiles(riRepo, pol));
  if (pol.oTagProtection) {
    scr.vChecks.push_back(checkTagProtection(riRepo, *pol.oTagProtection, rr));
  }

  for (const auto& cr : scr.vChecks) {
    ++scr.summary.iTotalChecks;
    if (cr.bSkipped) {
      ++scr.summary.iSkippedChecks;
    } else if (cr.bPassed) {
      ++scr.summary.iPassedChecks;
    } else {
      ++scr.summary.iFailedChecks;
    }
  }
  scr.bPassed = scr.summary.iFailedChecks == 0;
  spLog->info("Scan of {}/{} finished: {} passed, {} failed, {} skipped", riRepo.sOwner,
              riRepo.sRepo, scr.summary.iPassedChecks, scr.summary.iFailedChecks,
              scr.summary.iSkippedChecks);
  return scr;
}

}  // namespace gov::scan
