#include "core/ProtectionCleanup.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "github/ApiErrors.hpp"

#include <algorithm>
#include <optional>

namespace gov::core {

namespace {

constexpr const char* kHeadsPrefix = "refs/heads/";
constexpr const char* kPermissionHint = "insufficient permissions (requires admin access)";

std::string protectionPath(const common::RepoInfo& riRepo, const std::string& sBranch) {
  return "repos/" + riRepo.sOwner + "/" + riRepo.sRepo + "/branches/" + sBranch + "/protection";
}

template <typename T>
std::optional<T> optionalField(const nlohmann::json& jObj, const char* pKey) {
  if (!jObj.is_object() || !jObj.contains(pKey) || jObj[pKey].is_null()) {
    return std::nullopt;
  }
  return jObj[pKey].get<T>();
}

/// Read {"enabled": bool} wrappers used by the classic protection API.
std::optional<bool> enabledFlag(const nlohmann::json& jData, const char* pKey) {
  if (!jData.contains(pKey) || !jData[pKey].is_object()) {
    return std::nullopt;
  }
  return optionalField<bool>(jData[pKey], "enabled");
}

bool coversBranch(const common::RulesetSummary& rs, const std::string& sBranch) {
  if (rs.sTarget != "branch" || !rs.oBranches) {
    return false;
  }
  return std::any_of(rs.oBranches->begin(), rs.oBranches->end(), [&](const std::string& sRef) {
    return sRef == sBranch || sRef == "~ALL" || sRef == "~DEFAULT_BRANCH";
  });
}

}  // namespace

ProtectionCleanup::ProtectionCleanup(github::IGitHubClient& ghClient) : _ghClient(ghClient) {}

ProtectionCleanup::~ProtectionCleanup() = default;

std::vector<std::string> ProtectionCleanup::defaultBranches() {
  return {"main", "master", "develop"};
}

std::vector<common::RulesetSummary> ProtectionCleanup::fetchRulesetSummaries(
    const common::RepoInfo& riRepo) {
  nlohmann::json jRulesets;
  try {
    jRulesets = _ghClient.request(
        "GET", "repos/" + riRepo.sOwner + "/" + riRepo.sRepo + "/rulesets", std::nullopt);
  } catch (const std::exception& ex) {
    if (github::isNotFound(ex)) {
      return {};
    }
    if (github::isForbidden(ex)) {
      throw common::CleanupError("NO_PERMISSION",
                                 std::string("Cannot read rulesets: ") + kPermissionHint);
    }
    throw common::CleanupError("API_ERROR", std::string("Failed to fetch rulesets: ") + ex.what());
  }

  std::vector<common::RulesetSummary> vRulesets;
  if (!jRulesets.is_array()) {
    return vRulesets;
  }
  for (const auto& jRuleset : jRulesets) {
    common::RulesetSummary rs;
    rs.iId = jRuleset.value("id", static_cast<int64_t>(0));
    rs.sName = jRuleset.value("name", "");
    rs.sTarget = jRuleset.value("target", "");
    rs.sEnforcement = jRuleset.value("enforcement", "");

    const auto& jConditions = jRuleset.value("conditions", nlohmann::json::object());
    const auto& jRefName = jConditions.value("ref_name", nlohmann::json::object());
    if (jRefName.contains("include") && jRefName["include"].is_array()) {
      std::vector<std::string> vBranches;
      for (const auto& jRef : jRefName["include"]) {
        if (!jRef.is_string()) continue;
        std::string sRef = jRef.get<std::string>();
        if (sRef.rfind(kHeadsPrefix, 0) == 0) {
          sRef.erase(0, std::char_traits<char>::length(kHeadsPrefix));
        }
        vBranches.push_back(std::move(sRef));
      }
      rs.oBranches = std::move(vBranches);
    }
    vRulesets.push_back(std::move(rs));
  }
  return vRulesets;
}

std::optional<common::ClassicBranchProtection> ProtectionCleanup::fetchClassic(
    const common::RepoInfo& riRepo, const std::string& sBranch) {
  nlohmann::json jData;
  try {
    jData = _ghClient.request("GET", protectionPath(riRepo, sBranch), std::nullopt);
  } catch (const std::exception& ex) {
    if (github::isNotFound(ex)) {
      return std::nullopt;
    }
    if (github::isForbidden(ex)) {
      throw common::CleanupError("NO_PERMISSION",
                                 std::string("Cannot read branch protection: ") + kPermissionHint);
    }
    throw common::CleanupError("API_ERROR",
                               std::string("Failed to fetch branch protection: ") + ex.what());
  }

  common::ClassicBranchProtection cbp;
  cbp.sBranch = sBranch;
  if (!jData.is_object()) {
    return cbp;
  }

  if (jData.contains("required_pull_request_reviews")) {
    const auto& jReviews = jData["required_pull_request_reviews"];
    cbp.oRequiredReviews = optionalField<int>(jReviews, "required_approving_review_count");
    cbp.oDismissStaleReviews = optionalField<bool>(jReviews, "dismiss_stale_reviews");
    cbp.oRequireCodeOwnerReviews = optionalField<bool>(jReviews, "require_code_owner_reviews");
  }
  if (jData.contains("required_status_checks")) {
    const auto& jChecks = jData["required_status_checks"];
    cbp.oStatusCheckContexts = optionalField<std::vector<std::string>>(jChecks, "contexts");
    cbp.oStrict = optionalField<bool>(jChecks, "strict");
  }
  cbp.oEnforceAdmins = enabledFlag(jData, "enforce_admins");
  cbp.oRequireSignatures = enabledFlag(jData, "required_signatures");
  return cbp;
}

void ProtectionCleanup::classify(common::ProtectionPlan& ppPlan) {
  ppPlan.vOrphaned.clear();
  ppPlan.vConflicts.clear();
  for (const auto& cbp : ppPlan.vClassicRules) {
    auto it = std::find_if(ppPlan.vRulesets.begin(), ppPlan.vRulesets.end(),
                           [&](const common::RulesetSummary& rs) {
                             return coversBranch(rs, cbp.sBranch);
                           });
    if (it != ppPlan.vRulesets.end()) {
      ppPlan.vConflicts.push_back(common::ProtectionConflict{cbp, *it});
    } else {
      ppPlan.vOrphaned.push_back(cbp);
    }
  }
}

common::ProtectionPlan ProtectionCleanup::listAllProtection(
    const common::RepoInfo& riRepo, const std::vector<std::string>& vBranches) {
  common::ProtectionPlan ppPlan;
  ppPlan.vRulesets = fetchRulesetSummaries(riRepo);

  // Sequential to stay clear of secondary rate limits
  for (const auto& sBranch : vBranches) {
    auto oClassic = fetchClassic(riRepo, sBranch);
    if (oClassic) {
      ppPlan.vClassicRules.push_back(std::move(*oClassic));
    }
  }

  classify(ppPlan);
  return ppPlan;
}

void ProtectionCleanup::removeClassicProtection(const common::RepoInfo& riRepo,
                                                const std::string& sBranch) {
  try {
    _ghClient.request("DELETE", protectionPath(riRepo, sBranch), std::nullopt);
  } catch (const std::exception& ex) {
    if (github::isNotFound(ex)) {
      throw common::CleanupError("NOT_FOUND",
                                 "No classic protection found for branch '" + sBranch + "'");
    }
    if (github::isForbidden(ex)) {
      throw common::CleanupError(
          "NO_PERMISSION", std::string("Cannot remove branch protection: ") + kPermissionHint);
    }
    throw common::CleanupError("API_ERROR",
                               std::string("Failed to remove branch protection: ") + ex.what());
  }
}

CleanupOutcome ProtectionCleanup::runCleanup(const common::RepoInfo& riRepo,
                                             const std::vector<std::string>& vBranches,
                                             bool bApply) {
  CleanupOutcome co;
  co.ppPlan = listAllProtection(riRepo, vBranches);
  co.bApplied = bApply;
  if (!bApply) {
    return co;
  }

  auto spLog = common::Logger::get();
  for (const auto& cbp : co.ppPlan.vOrphaned) {
    spLog->info("Removing classic protection from branch: {}", cbp.sBranch);
    removeClassicProtection(riRepo, cbp.sBranch);
    co.vRemoved.push_back(cbp.sBranch);
  }
  // The ruleset takes precedence over a conflicting classic rule
  for (const auto& pc : co.ppPlan.vConflicts) {
    spLog->info("Removing conflicting classic protection from branch: {}",
                pc.cbpClassic.sBranch);
    removeClassicProtection(riRepo, pc.cbpClassic.sBranch);
    co.vRemoved.push_back(pc.cbpClassic.sBranch);
  }
  return co;
}

}  // namespace gov::core
