#include "core/Applier.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/ProtectionFetcher.hpp"
#include "github/ApiErrors.hpp"

namespace gov::core {

Applier::Applier(github::IGitHubClient& ghClient) : _ghClient(ghClient) {}

Applier::~Applier() = default;

nlohmann::json Applier::buildBranchRulesetBody(const std::string& sBranch,
                                               const common::DesiredBranchProtection& dbpDesired) {
  nlohmann::json jRules = nlohmann::json::array();

  if (dbpDesired.oRequiredReviews.has_value() || dbpDesired.oDismissStaleReviews.has_value() ||
      dbpDesired.oRequireCodeOwnerReviews.has_value()) {
    jRules.push_back({
        {"type", "pull_request"},
        {"parameters",
         {
             {"required_approving_review_count", dbpDesired.oRequiredReviews.value_or(0)},
             {"dismiss_stale_reviews_on_push", dbpDesired.oDismissStaleReviews.value_or(false)},
             {"require_code_owner_review", dbpDesired.oRequireCodeOwnerReviews.value_or(false)},
             {"require_last_push_approval", false},
             {"required_review_thread_resolution", false},
         }},
    });
  }

  if (dbpDesired.oRequireStatusChecks.has_value()) {
    nlohmann::json jChecks = nlohmann::json::array();
    for (const auto& sContext : *dbpDesired.oRequireStatusChecks) {
      jChecks.push_back({{"context", sContext}});
    }
    jRules.push_back({
        {"type", "required_status_checks"},
        {"parameters",
         {
             {"required_status_checks", jChecks},
             {"strict_required_status_checks_policy",
              dbpDesired.oRequireBranchesUpToDate.value_or(false)},
         }},
    });
  }

  if (dbpDesired.oRequireSignedCommits.value_or(false)) {
    jRules.push_back({{"type", "required_signatures"}});
  }

  return {
      {"name", ProtectionFetcher::kBranchRulesetName},
      {"target", "branch"},
      {"enforcement", "active"},
      {"conditions",
       {{"ref_name",
         {{"include", nlohmann::json::array({"refs/heads/" + sBranch})},
          {"exclude", nlohmann::json::array()}}}}},
      {"bypass_actors", nlohmann::json::array()},
      {"rules", jRules},
  };
}

nlohmann::json Applier::buildTagRulesetBody(const common::DesiredTagProtection& dtpDesired) {
  nlohmann::json jRules = nlohmann::json::array();
  if (dtpDesired.oPreventDeletion.value_or(true)) {
    jRules.push_back({{"type", "deletion"}});
  }
  if (dtpDesired.oPreventUpdate.value_or(true)) {
    jRules.push_back({{"type", "update"}});
  }

  nlohmann::json jInclude = nlohmann::json::array();
  for (const auto& sPattern : dtpDesired.oPatterns.value_or(std::vector<std::string>{"v*"})) {
    jInclude.push_back("refs/tags/" + sPattern);
  }

  return {
      {"name", ProtectionFetcher::kTagRulesetName},
      {"target", "tag"},
      {"enforcement", "active"},
      {"conditions",
       {{"ref_name", {{"include", jInclude}, {"exclude", nlohmann::json::array()}}}}},
      {"rules", jRules},
  };
}

common::SyncResult Applier::submit(const common::RepoInfo& riRepo,
                                   const std::optional<int64_t>& oId, const nlohmann::json& jBody,
                                   const std::vector<common::SettingDiff>& vDiffs,
                                   const std::string& sWhat) {
  auto spLog = common::Logger::get();
  const std::string sBase = "repos/" + riRepo.sOwner + "/" + riRepo.sRepo + "/rulesets";

  try {
    if (oId.has_value()) {
      spLog->info("Updating {} ruleset {} on {}/{}", sWhat, *oId, riRepo.sOwner, riRepo.sRepo);
      _ghClient.request("PUT", sBase + "/" + std::to_string(*oId), jBody);
    } else {
      spLog->info("Creating {} ruleset on {}/{}", sWhat, riRepo.sOwner, riRepo.sRepo);
      _ghClient.request("POST", sBase, jBody);
    }
  } catch (const std::exception& ex) {
    if (github::isForbidden(ex)) {
      throw common::ApplierError("NO_PERMISSION", "Cannot update " + sWhat +
                                                      ": insufficient permissions "
                                                      "(requires admin access)");
    }

    // The ruleset call is atomic: every requested diff failed together
    spLog->error("Failed to apply {}: {}", sWhat, ex.what());
    common::SyncResult srFailed;
    srFailed.bSuccess = false;
    for (const auto& sd : vDiffs) {
      srFailed.vFailed.push_back(common::FailedDiff{sd, ex.what()});
    }
    return srFailed;
  }

  return common::SyncResult{true, vDiffs, {}};
}

common::SyncResult Applier::applyBranchProtection(
    const common::RepoInfo& riRepo, const std::string& sBranch,
    const common::DesiredBranchProtection& dbpDesired, const common::SyncDiffResult& sdrDiff) {
  if (!sdrDiff.bHasChanges) {
    return common::SyncResult{true, {}, {}};
  }
  return submit(riRepo, sdrDiff.oCurrentRulesetId, buildBranchRulesetBody(sBranch, dbpDesired),
                sdrDiff.vDiffs, "branch protection");
}

common::SyncResult Applier::applyTagProtection(const common::RepoInfo& riRepo,
                                               const common::DesiredTagProtection& dtpDesired,
                                               const common::TagProtectionDiffResult& tdrDiff) {
  if (!tdrDiff.bHasChanges) {
    return common::SyncResult{true, {}, {}};
  }
  return submit(riRepo, tdrDiff.oCurrentRulesetId, buildTagRulesetBody(dtpDesired),
                tdrDiff.vDiffs, "tag protection");
}

}  // namespace gov::core
