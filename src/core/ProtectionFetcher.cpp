#include "core/ProtectionFetcher.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "github/ApiErrors.hpp"

#include <algorithm>
#include <vector>

namespace gov::core {

namespace {

constexpr const char* kHeadsPrefix = "refs/heads/";
constexpr const char* kTagsPrefix = "refs/tags/";

std::string repoPath(const common::RepoInfo& riRepo) {
  return "repos/" + riRepo.sOwner + "/" + riRepo.sRepo;
}

std::vector<std::string> includePatterns(const nlohmann::json& jRuleset) {
  std::vector<std::string> vInclude;
  if (!jRuleset.contains("conditions") || !jRuleset["conditions"].is_object()) {
    return vInclude;
  }
  const auto& jRefName = jRuleset["conditions"].value("ref_name", nlohmann::json::object());
  if (jRefName.contains("include") && jRefName["include"].is_array()) {
    for (const auto& jPattern : jRefName["include"]) {
      if (jPattern.is_string()) vInclude.push_back(jPattern.get<std::string>());
    }
  }
  return vInclude;
}

const nlohmann::json* findRule(const nlohmann::json& jRuleset, const std::string& sType) {
  if (!jRuleset.contains("rules") || !jRuleset["rules"].is_array()) {
    return nullptr;
  }
  for (const auto& jRule : jRuleset["rules"]) {
    if (jRule.value("type", "") == sType) {
      return &jRule;
    }
  }
  return nullptr;
}

template <typename T>
std::optional<T> optionalParam(const nlohmann::json& jRule, const char* pKey) {
  if (!jRule.contains("parameters") || !jRule["parameters"].is_object()) {
    return std::nullopt;
  }
  const auto& jParams = jRule["parameters"];
  if (!jParams.contains(pKey) || jParams[pKey].is_null()) {
    return std::nullopt;
  }
  return jParams[pKey].get<T>();
}

}  // namespace

ProtectionFetcher::ProtectionFetcher(github::IGitHubClient& ghClient) : _ghClient(ghClient) {}

ProtectionFetcher::~ProtectionFetcher() = default;

common::RepoInfo ProtectionFetcher::getRepoInfo(const std::string& sProjectRoot) {
  try {
    const auto jRepo = _ghClient.viewRepo(sProjectRoot);
    return common::RepoInfo{jRepo.at("owner").at("login").get<std::string>(),
                            jRepo.at("name").get<std::string>()};
  } catch (const std::exception& ex) {
    common::Logger::get()->debug("gh repo view failed: {}", ex.what());
    throw common::RemoteFetcherError("NO_REPO",
                                     "Could not determine GitHub repository from git remote");
  }
}

nlohmann::json ProtectionFetcher::fetchRulesets(const common::RepoInfo& riRepo) {
  nlohmann::json jRulesets;
  try {
    jRulesets = _ghClient.request("GET", repoPath(riRepo) + "/rulesets", std::nullopt);
  } catch (const std::exception& ex) {
    if (github::isNotFound(ex)) {
      return nlohmann::json::array();
    }
    if (github::isForbidden(ex)) {
      throw common::RemoteFetcherError(
          "NO_PERMISSION", "Cannot read rulesets: insufficient permissions (requires admin access)");
    }
    throw common::RemoteFetcherError("API_ERROR",
                                     std::string("Failed to fetch rulesets: ") + ex.what());
  }

  if (!jRulesets.is_array()) {
    return nlohmann::json::array();
  }

  // The list endpoint may omit rules and conditions; complete them on demand
  for (auto& jRuleset : jRulesets) {
    if (jRuleset.contains("rules") || !jRuleset.contains("id")) {
      continue;
    }
    const std::string sPath =
        repoPath(riRepo) + "/rulesets/" + std::to_string(jRuleset["id"].get<int64_t>());
    try {
      jRuleset = _ghClient.request("GET", sPath, std::nullopt);
    } catch (const std::exception& ex) {
      if (github::isForbidden(ex)) {
        throw common::RemoteFetcherError(
            "NO_PERMISSION",
            "Cannot read rulesets: insufficient permissions (requires admin access)");
      }
      throw common::RemoteFetcherError("API_ERROR",
                                       std::string("Failed to fetch ruleset: ") + ex.what());
    }
  }
  return jRulesets;
}

std::optional<nlohmann::json> ProtectionFetcher::findBranchRuleset(
    const nlohmann::json& jRulesets, const std::string& sBranch) {
  if (!jRulesets.is_array()) {
    return std::nullopt;
  }
  const std::string sRef = kHeadsPrefix + sBranch;
  for (const auto& jRuleset : jRulesets) {
    if (jRuleset.value("target", "") != "branch" ||
        jRuleset.value("enforcement", "") != "active") {
      continue;
    }
    const auto vInclude = includePatterns(jRuleset);
    if (std::find(vInclude.begin(), vInclude.end(), sRef) != vInclude.end()) {
      return jRuleset;
    }
  }
  return std::nullopt;
}

common::BranchProtectionSettings ProtectionFetcher::parseBranchRuleset(
    const std::string& sBranch, const std::optional<nlohmann::json>& ojRuleset) {
  common::BranchProtectionSettings bps;
  bps.sBranch = sBranch;
  if (!ojRuleset.has_value()) {
    return bps;
  }
  const auto& jRuleset = *ojRuleset;

  if (const auto* pRule = findRule(jRuleset, "pull_request")) {
    bps.oRequiredReviews = optionalParam<int>(*pRule, "required_approving_review_count");
    bps.oDismissStaleReviews = optionalParam<bool>(*pRule, "dismiss_stale_reviews_on_push");
    bps.oRequireCodeOwnerReviews = optionalParam<bool>(*pRule, "require_code_owner_review");
  }

  if (const auto* pRule = findRule(jRuleset, "required_status_checks")) {
    const auto ojChecks = optionalParam<nlohmann::json>(*pRule, "required_status_checks");
    if (ojChecks.has_value() && ojChecks->is_array()) {
      std::vector<std::string> vContexts;
      for (const auto& jCheck : *ojChecks) {
        vContexts.push_back(jCheck.value("context", ""));
      }
      bps.oRequiredStatusChecks = std::move(vContexts);
    }
    bps.oRequireBranchesUpToDate =
        optionalParam<bool>(*pRule, "strict_required_status_checks_policy");
  }

  if (findRule(jRuleset, "required_signatures") != nullptr) {
    bps.oRequireSignedCommits = true;
  }

  std::vector<common::BypassActor> vActors;
  if (jRuleset.contains("bypass_actors") && jRuleset["bypass_actors"].is_array()) {
    for (const auto& jActor : jRuleset["bypass_actors"]) {
      vActors.push_back(common::BypassActor{
          jActor.value("actor_id", static_cast<int64_t>(0)),
          jActor.value("actor_type", ""),
          jActor.value("bypass_mode", ""),
      });
    }
  }
  // Rulesets have no enforce_admins switch: admins are enforced when nobody may bypass
  bps.oEnforceAdmins = vActors.empty();
  if (!vActors.empty()) {
    bps.oBypassActors = std::move(vActors);
  }

  if (jRuleset.contains("id") && jRuleset["id"].is_number_integer()) {
    bps.oRulesetId = jRuleset["id"].get<int64_t>();
  }
  if (jRuleset.contains("name") && jRuleset["name"].is_string()) {
    bps.oRulesetName = jRuleset["name"].get<std::string>();
  }
  return bps;
}

common::BranchProtectionSettings ProtectionFetcher::fetchBranchProtection(
    const common::RepoInfo& riRepo, const std::string& sBranch) {
  const auto jRulesets = fetchRulesets(riRepo);
  return parseBranchRuleset(sBranch, findBranchRuleset(jRulesets, sBranch));
}

common::TagProtectionSettings ProtectionFetcher::parseTagRuleset(const nlohmann::json& jRulesets) {
  common::TagProtectionSettings tps;
  if (!jRulesets.is_array()) {
    return tps;
  }

  for (const auto& jRuleset : jRulesets) {
    if (jRuleset.value("target", "") != "tag" || jRuleset.value("name", "") != kTagRulesetName) {
      continue;
    }

    const std::string sPrefix = kTagsPrefix;
    for (auto sPattern : includePatterns(jRuleset)) {
      if (sPattern.rfind(sPrefix, 0) == 0) {
        sPattern.erase(0, sPrefix.size());
      }
      tps.vPatterns.push_back(std::move(sPattern));
    }
    tps.bPreventDeletion = findRule(jRuleset, "deletion") != nullptr;
    tps.bPreventUpdate = findRule(jRuleset, "update") != nullptr;
    if (jRuleset.contains("id") && jRuleset["id"].is_number_integer()) {
      tps.oRulesetId = jRuleset["id"].get<int64_t>();
    }
    tps.oRulesetName = jRuleset.value("name", "");
    break;
  }
  return tps;
}

common::TagProtectionSettings ProtectionFetcher::fetchTagProtection(
    const common::RepoInfo& riRepo) {
  return parseTagRuleset(fetchRulesets(riRepo));
}

}  // namespace gov::core
