#include "common/PolicyLoader.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <filesystem>
#include <limits>

namespace gov::common {

namespace {

constexpr const char* kRepoTable = "process.repo";
constexpr const char* kRulesetTable = "process.repo.ruleset";
constexpr const char* kTagTable = "process.tag_protection";
constexpr const char* kExtendsTable = "extends";

std::string key(const char* pTable, const char* pName) {
  return std::string(pTable) + "." + pName;
}

std::optional<int> getSmallInt(const TomlDocument& tdDoc, const std::string& sKey) {
  auto oValue = tdDoc.getInt(sKey);
  if (!oValue) {
    return std::nullopt;
  }
  if (*oValue < 0 || *oValue > std::numeric_limits<int>::max()) {
    throw ConfigError("check.toml: '" + sKey + "' must be a non-negative integer");
  }
  return static_cast<int>(*oValue);
}

DesiredBranchProtection loadRuleset(const TomlDocument& tdDoc) {
  DesiredBranchProtection dbp;
  dbp.oBranch = tdDoc.getString(key(kRulesetTable, "branch"));
  dbp.oRequiredReviews = getSmallInt(tdDoc, key(kRulesetTable, "required_reviews"));
  dbp.oDismissStaleReviews = tdDoc.getBool(key(kRulesetTable, "dismiss_stale_reviews"));
  dbp.oRequireCodeOwnerReviews =
      tdDoc.getBool(key(kRulesetTable, "require_code_owner_reviews"));
  dbp.oRequireStatusChecks = tdDoc.getStringArray(key(kRulesetTable, "require_status_checks"));
  dbp.oRequireBranchesUpToDate =
      tdDoc.getBool(key(kRulesetTable, "require_branches_up_to_date"));
  dbp.oRequireSignedCommits = tdDoc.getBool(key(kRulesetTable, "require_signed_commits"));
  dbp.oEnforceAdmins = tdDoc.getBool(key(kRulesetTable, "enforce_admins"));
  return dbp;
}

}  // namespace

Policy PolicyLoader::fromDocument(const TomlDocument& tdDoc) {
  Policy pol;

  // ── [process.repo] ─────────────────────────────────────────────────────
  pol.rpRepo.bEnabled = tdDoc.getBool(key(kRepoTable, "enabled")).value_or(false);
  pol.rpRepo.bRequireBranchProtection =
      tdDoc.getBool(key(kRepoTable, "require_branch_protection")).value_or(false);
  pol.rpRepo.bRequireCodeowners =
      tdDoc.getBool(key(kRepoTable, "require_codeowners")).value_or(false);
  if (tdDoc.hasTable(kRulesetTable)) {
    pol.rpRepo.oRuleset = loadRuleset(tdDoc);
  }

  // ── [process.tag_protection] ───────────────────────────────────────────
  if (tdDoc.hasTable(kTagTable) && tdDoc.getBool(key(kTagTable, "enabled")).value_or(true)) {
    DesiredTagProtection dtp;
    dtp.oPatterns = tdDoc.getStringArray(key(kTagTable, "patterns"));
    dtp.oPreventDeletion = tdDoc.getBool(key(kTagTable, "prevent_deletion"));
    dtp.oPreventUpdate = tdDoc.getBool(key(kTagTable, "prevent_update"));
    pol.oTagProtection = dtp;
  }

  // ── [extends] ──────────────────────────────────────────────────────────
  if (tdDoc.hasTable(kExtendsTable)) {
    ExtendsPolicy ep;
    ep.oRegistry = tdDoc.getString(key(kExtendsTable, "registry"));
    ep.vRulesets = tdDoc.getStringArray(key(kExtendsTable, "rulesets")).value_or(
        std::vector<std::string>{});
    pol.oExtends = ep;
  }

  return pol;
}

Policy PolicyLoader::loadFile(const std::string& sPath) {
  if (!std::filesystem::exists(sPath)) {
    throw ConfigError("Policy file not found: " + sPath);
  }
  Logger::get()->debug("Loading policy from {}", sPath);
  return fromDocument(TomlDocument::parseFile(sPath));
}

}  // namespace gov::common
