#include "core/Differ.hpp"

#include <array>
#include <functional>
#include <optional>
#include <set>
#include <vector>

namespace gov::core {

namespace {

using common::BranchProtectionSettings;
using common::DesiredBranchProtection;
using common::DiffAction;
using common::SettingDiff;

template <typename T>
nlohmann::json toJson(const std::optional<T>& oValue) {
  return oValue.has_value() ? nlohmann::json(*oValue) : nlohmann::json(nullptr);
}

template <typename T>
std::optional<nlohmann::json> toDesired(const std::optional<T>& oValue) {
  if (!oValue.has_value()) return std::nullopt;
  return nlohmann::json(*oValue);
}

/// One managed setting: how to read it from each side.
struct SettingDescriptor {
  const char* pName;
  std::function<nlohmann::json(const BranchProtectionSettings&)> fnCurrent;
  std::function<std::optional<nlohmann::json>(const DesiredBranchProtection&)> fnDesired;
  bool bIsArray;
};

const std::array<SettingDescriptor, 7>& branchDescriptors() {
  static const std::array<SettingDescriptor, 7> aDescriptors = {{
      {Differ::kBranchSettings[0],
       [](const BranchProtectionSettings& c) { return toJson(c.oRequiredReviews); },
       [](const DesiredBranchProtection& d) { return toDesired(d.oRequiredReviews); }, false},
      {Differ::kBranchSettings[1],
       [](const BranchProtectionSettings& c) { return toJson(c.oDismissStaleReviews); },
       [](const DesiredBranchProtection& d) { return toDesired(d.oDismissStaleReviews); }, false},
      {Differ::kBranchSettings[2],
       [](const BranchProtectionSettings& c) { return toJson(c.oRequireCodeOwnerReviews); },
       [](const DesiredBranchProtection& d) { return toDesired(d.oRequireCodeOwnerReviews); },
       false},
      {Differ::kBranchSettings[3],
       [](const BranchProtectionSettings& c) { return toJson(c.oRequiredStatusChecks); },
       [](const DesiredBranchProtection& d) { return toDesired(d.oRequireStatusChecks); }, true},
      {Differ::kBranchSettings[4],
       [](const BranchProtectionSettings& c) { return toJson(c.oRequireBranchesUpToDate); },
       [](const DesiredBranchProtection& d) { return toDesired(d.oRequireBranchesUpToDate); },
       false},
      {Differ::kBranchSettings[5],
       [](const BranchProtectionSettings& c) { return toJson(c.oRequireSignedCommits); },
       [](const DesiredBranchProtection& d) { return toDesired(d.oRequireSignedCommits); },
       false},
      {Differ::kBranchSettings[6],
       [](const BranchProtectionSettings& c) { return toJson(c.oEnforceAdmins); },
       [](const DesiredBranchProtection& d) { return toDesired(d.oEnforceAdmins); }, false},
  }};
  return aDescriptors;
}

std::optional<SettingDiff> compareValue(const std::string& sSetting,
                                        const nlohmann::json& jCurrent,
                                        const nlohmann::json& jDesired) {
  if (jCurrent == jDesired) {
    return std::nullopt;
  }
  return SettingDiff{sSetting, jCurrent, jDesired,
                     jCurrent.is_null() ? DiffAction::Add : DiffAction::Change};
}

/// Arrays compare as sets: order and duplicates are ignored.
std::optional<SettingDiff> compareArrayValue(const std::string& sSetting,
                                             const nlohmann::json& jCurrent,
                                             const nlohmann::json& jDesired) {
  const nlohmann::json jCurrentArray = jCurrent.is_null() ? nlohmann::json::array() : jCurrent;

  const auto setCurrent = jCurrentArray.get<std::set<std::string>>();
  const auto setDesired = jDesired.get<std::set<std::string>>();
  if (setCurrent == setDesired) {
    return std::nullopt;
  }

  return SettingDiff{sSetting, jCurrentArray, jDesired,
                     jCurrentArray.empty() ? DiffAction::Add : DiffAction::Change};
}

}  // namespace

common::SyncDiffResult Differ::computeDiff(const common::RepoInfo& riRepo,
                                           const BranchProtectionSettings& bpsCurrent,
                                           const DesiredBranchProtection& dbpDesired) {
  common::SyncDiffResult sdr;
  sdr.riRepo = riRepo;
  sdr.sBranch = bpsCurrent.sBranch;
  sdr.oCurrentRulesetId = bpsCurrent.oRulesetId;

  for (const auto& descriptor : branchDescriptors()) {
    const auto ojDesired = descriptor.fnDesired(dbpDesired);
    if (!ojDesired.has_value()) {
      continue;
    }

    const nlohmann::json jCurrent = descriptor.fnCurrent(bpsCurrent);
    auto oDiff = descriptor.bIsArray ? compareArrayValue(descriptor.pName, jCurrent, *ojDesired)
                                     : compareValue(descriptor.pName, jCurrent, *ojDesired);
    if (oDiff.has_value()) {
      sdr.vDiffs.push_back(std::move(*oDiff));
    }
  }

  sdr.bHasChanges = !sdr.vDiffs.empty();
  return sdr;
}

common::TagProtectionDiffResult Differ::computeTagDiff(
    const common::RepoInfo& riRepo, const common::TagProtectionSettings& tpsCurrent,
    const common::DesiredTagProtection& dtpDesired) {
  common::TagProtectionDiffResult tdr;
  tdr.riRepo = riRepo;
  tdr.oCurrentRulesetId = tpsCurrent.oRulesetId;

  // Without a ruleset both flags read as false and every diff is an add
  const bool bExists = tpsCurrent.oRulesetId.has_value();
  const DiffAction action = bExists ? DiffAction::Change : DiffAction::Add;

  if (dtpDesired.oPatterns.has_value()) {
    const std::set<std::string> setCurrent(tpsCurrent.vPatterns.begin(),
                                           tpsCurrent.vPatterns.end());
    const std::set<std::string> setDesired(dtpDesired.oPatterns->begin(),
                                           dtpDesired.oPatterns->end());
    if (setCurrent != setDesired) {
      tdr.vDiffs.push_back(
          SettingDiff{"patterns", tpsCurrent.vPatterns, *dtpDesired.oPatterns, action});
    }
  }

  if (dtpDesired.oPreventDeletion.has_value() &&
      tpsCurrent.bPreventDeletion != *dtpDesired.oPreventDeletion) {
    tdr.vDiffs.push_back(SettingDiff{"prevent_deletion",
                                     bExists ? nlohmann::json(tpsCurrent.bPreventDeletion)
                                             : nlohmann::json(nullptr),
                                     *dtpDesired.oPreventDeletion, action});
  }

  if (dtpDesired.oPreventUpdate.has_value() &&
      tpsCurrent.bPreventUpdate != *dtpDesired.oPreventUpdate) {
    tdr.vDiffs.push_back(SettingDiff{"prevent_update",
                                     bExists ? nlohmann::json(tpsCurrent.bPreventUpdate)
                                             : nlohmann::json(nullptr),
                                     *dtpDesired.oPreventUpdate, action});
  }

  tdr.bHasChanges = !tdr.vDiffs.empty();
  return tdr;
}

std::string Differ::formatValue(const nlohmann::json& jValue) {
  if (jValue.is_null()) {
    return "not set";
  }
  if (jValue.is_array()) {
    std::string sOut = "[";
    for (size_t i = 0; i < jValue.size(); ++i) {
      if (i > 0) sOut += ", ";
      sOut += jValue[i].is_string() ? jValue[i].get<std::string>() : jValue[i].dump();
    }
    return sOut + "]";
  }
  if (jValue.is_string()) {
    return jValue.get<std::string>();
  }
  return jValue.dump();
}

}  // namespace gov::core
