#include "core/Differ.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace gov::common;
using gov::core::Differ;

namespace {

const RepoInfo kRepo{"acme", "widgets"};

BranchProtectionSettings emptyCurrent() {
  BranchProtectionSettings bps;
  bps.sBranch = "main";
  return bps;
}

}  // namespace

TEST(DifferTest, EmptyDesiredYieldsNoDiffs) {
  auto bps = emptyCurrent();
  bps.oRequiredReviews = 1;
  auto sdr = Differ::computeDiff(kRepo, bps, DesiredBranchProtection{});
  EXPECT_TRUE(sdr.vDiffs.empty());
  EXPECT_FALSE(sdr.bHasChanges);
  EXPECT_EQ(sdr.sBranch, "main");
  EXPECT_EQ(sdr.riRepo, kRepo);
}

TEST(DifferTest, ChangedScalarIsChange) {
  auto bps = emptyCurrent();
  bps.oRequiredReviews = 1;
  DesiredBranchProtection dbp;
  dbp.oRequiredReviews = 2;

  auto sdr = Differ::computeDiff(kRepo, bps, dbp);
  ASSERT_EQ(sdr.vDiffs.size(), 1u);
  EXPECT_EQ(sdr.vDiffs[0].sSetting, "required_reviews");
  EXPECT_EQ(sdr.vDiffs[0].jCurrent, 1);
  EXPECT_EQ(sdr.vDiffs[0].jDesired, 2);
  EXPECT_EQ(sdr.vDiffs[0].action, DiffAction::Change);
  EXPECT_TRUE(sdr.bHasChanges);
}

TEST(DifferTest, UnsetScalarIsAdd) {
  DesiredBranchProtection dbp;
  dbp.oRequireSignedCommits = true;

  auto sdr = Differ::computeDiff(kRepo, emptyCurrent(), dbp);
  ASSERT_EQ(sdr.vDiffs.size(), 1u);
  EXPECT_TRUE(sdr.vDiffs[0].jCurrent.is_null());
  EXPECT_EQ(sdr.vDiffs[0].action, DiffAction::Add);
}

TEST(DifferTest, FalseIsDistinctFromUnset) {
  auto bps = emptyCurrent();
  bps.oDismissStaleReviews = false;
  DesiredBranchProtection dbp;
  dbp.oDismissStaleReviews = false;
  EXPECT_FALSE(Differ::computeDiff(kRepo, bps, dbp).bHasChanges);

  dbp.oDismissStaleReviews = false;
  auto sdr = Differ::computeDiff(kRepo, emptyCurrent(), dbp);
  ASSERT_EQ(sdr.vDiffs.size(), 1u);
  EXPECT_EQ(sdr.vDiffs[0].action, DiffAction::Add);
}

TEST(DifferTest, StatusChecksCompareAsSets) {
  auto bps = emptyCurrent();
  bps.oRequiredStatusChecks = std::vector<std::string>{"test", "lint"};
  DesiredBranchProtection dbp;
  dbp.oRequireStatusChecks = std::vector<std::string>{"lint", "test", "lint"};

  EXPECT_FALSE(Differ::computeDiff(kRepo, bps, dbp).bHasChanges);
}

TEST(DifferTest, StatusChecksFromNothingIsAddWithEmptyCurrent) {
  DesiredBranchProtection dbp;
  dbp.oRequireStatusChecks = std::vector<std::string>{"ci"};

  auto sdr = Differ::computeDiff(kRepo, emptyCurrent(), dbp);
  ASSERT_EQ(sdr.vDiffs.size(), 1u);
  EXPECT_EQ(sdr.vDiffs[0].sSetting, "require_status_checks");
  EXPECT_EQ(sdr.vDiffs[0].jCurrent, nlohmann::json::array());
  EXPECT_EQ(sdr.vDiffs[0].action, DiffAction::Add);
}

TEST(DifferTest, StatusChecksChangeKeepsRawCurrent) {
  auto bps = emptyCurrent();
  bps.oRequiredStatusChecks = std::vector<std::string>{"b", "a"};
  DesiredBranchProtection dbp;
  dbp.oRequireStatusChecks = std::vector<std::string>{"a", "c"};

  auto sdr = Differ::computeDiff(kRepo, bps, dbp);
  ASSERT_EQ(sdr.vDiffs.size(), 1u);
  EXPECT_EQ(sdr.vDiffs[0].jCurrent, nlohmann::json::array({"b", "a"}));
  EXPECT_EQ(sdr.vDiffs[0].action, DiffAction::Change);
}

TEST(DifferTest, DiffsFollowFixedSettingOrder) {
  DesiredBranchProtection dbp;
  dbp.oEnforceAdmins = true;
  dbp.oRequireSignedCommits = true;
  dbp.oRequireBranchesUpToDate = true;
  dbp.oRequireStatusChecks = std::vector<std::string>{"ci"};
  dbp.oRequireCodeOwnerReviews = true;
  dbp.oDismissStaleReviews = true;
  dbp.oRequiredReviews = 1;

  auto sdr = Differ::computeDiff(kRepo, emptyCurrent(), dbp);
  ASSERT_EQ(sdr.vDiffs.size(), 7u);
  for (size_t i = 0; i < sdr.vDiffs.size(); ++i) {
    EXPECT_EQ(sdr.vDiffs[i].sSetting, Differ::kBranchSettings[i]);
  }
}

TEST(DifferTest, CarriesCurrentRulesetId) {
  auto bps = emptyCurrent();
  bps.oRulesetId = 123;
  auto sdr = Differ::computeDiff(kRepo, bps, DesiredBranchProtection{});
  ASSERT_TRUE(sdr.oCurrentRulesetId.has_value());
  EXPECT_EQ(*sdr.oCurrentRulesetId, 123);
}

TEST(DifferTest, TagDiffWithoutRulesetIsAdd) {
  DesiredTagProtection dtp;
  dtp.oPatterns = std::vector<std::string>{"v*"};
  dtp.oPreventDeletion = true;
  dtp.oPreventUpdate = true;

  auto tdr = Differ::computeTagDiff(kRepo, TagProtectionSettings{}, dtp);
  ASSERT_EQ(tdr.vDiffs.size(), 3u);
  for (const auto& sd : tdr.vDiffs) {
    EXPECT_EQ(sd.action, DiffAction::Add);
  }
  EXPECT_EQ(tdr.vDiffs[0].sSetting, "patterns");
  EXPECT_EQ(tdr.vDiffs[1].sSetting, "prevent_deletion");
  EXPECT_TRUE(tdr.vDiffs[1].jCurrent.is_null());
  EXPECT_EQ(tdr.vDiffs[2].sSetting, "prevent_update");
}

TEST(DifferTest, TagDiffAgainstExistingRuleset) {
  TagProtectionSettings tps;
  tps.vPatterns = {"release-*", "v*"};
  tps.bPreventDeletion = true;
  tps.bPreventUpdate = false;
  tps.oRulesetId = 9;

  DesiredTagProtection dtp;
  dtp.oPatterns = std::vector<std::string>{"v*", "release-*"};
  dtp.oPreventDeletion = true;
  dtp.oPreventUpdate = true;

  auto tdr = Differ::computeTagDiff(kRepo, tps, dtp);
  ASSERT_EQ(tdr.vDiffs.size(), 1u);
  EXPECT_EQ(tdr.vDiffs[0].sSetting, "prevent_update");
  EXPECT_EQ(tdr.vDiffs[0].jCurrent, false);
  EXPECT_EQ(tdr.vDiffs[0].action, DiffAction::Change);
  EXPECT_EQ(tdr.oCurrentRulesetId, std::optional<int64_t>(9));
}

TEST(DifferTest, FormatValue) {
  EXPECT_EQ(Differ::formatValue(nullptr), "not set");
  EXPECT_EQ(Differ::formatValue(nlohmann::json::array()), "[]");
  EXPECT_EQ(Differ::formatValue(nlohmann::json::array({"a", "b"})), "[a, b]");
  EXPECT_EQ(Differ::formatValue(true), "true");
  EXPECT_EQ(Differ::formatValue(3), "3");
}
