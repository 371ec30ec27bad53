#include "core/ProtectionCleanup.hpp"

#include <gtest/gtest.h>

#include <string>

#include "FakeGitHubClient.hpp"
#include "common/Errors.hpp"

using namespace gov::common;
using gov::core::ProtectionCleanup;
using gov::test::FakeGitHubClient;

namespace {

const RepoInfo kRepo{"acme", "widgets"};

nlohmann::json classicProtection() {
  return nlohmann::json::parse(R"({
    "required_status_checks": {"contexts": ["ci"], "strict": true},
    "required_pull_request_reviews": {
      "required_approving_review_count": 1,
      "dismiss_stale_reviews": false,
      "require_code_owner_reviews": true},
    "enforce_admins": {"enabled": true},
    "required_signatures": {"enabled": false}
  })");
}

/// Rulesets cover main only; classic protection exists on main and develop.
FakeGitHubClient::Handler repoHandler() {
  return [](const std::string& sMethod, const std::string& sPath,
            const std::optional<nlohmann::json>&) -> nlohmann::json {
    if (sMethod == "GET" && sPath == "repos/acme/widgets/rulesets") {
      return nlohmann::json::parse(R"([{
        "id": 1, "name": "Branch Protection", "target": "branch", "enforcement": "active",
        "conditions": {"ref_name": {"include": ["refs/heads/main"]}}
      }])");
    }
    if (sPath == "repos/acme/widgets/branches/main/protection" ||
        sPath == "repos/acme/widgets/branches/develop/protection") {
      return sMethod == "GET" ? classicProtection() : nlohmann::json(nullptr);
    }
    throw gov::test::httpError(404, "Branch not protected");
  };
}

std::string cleanupCode(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const CleanupError& e) {
    return e._sErrorCode;
  }
  return "";
}

}  // namespace

TEST(ProtectionCleanupTest, DefaultBranches) {
  EXPECT_EQ(ProtectionCleanup::defaultBranches(),
            (std::vector<std::string>{"main", "master", "develop"}));
}

TEST(ProtectionCleanupTest, ClassifiesConflictsAndOrphans) {
  FakeGitHubClient fake;
  fake.fnHandler = repoHandler();
  ProtectionCleanup pcl(fake);

  auto pp = pcl.listAllProtection(kRepo, ProtectionCleanup::defaultBranches());
  ASSERT_EQ(pp.vRulesets.size(), 1u);
  EXPECT_EQ(pp.vRulesets[0].oBranches, std::optional<std::vector<std::string>>({"main"}));

  ASSERT_EQ(pp.vClassicRules.size(), 2u);
  EXPECT_EQ(pp.vClassicRules[0].sBranch, "main");
  EXPECT_EQ(pp.vClassicRules[0].oRequiredReviews, std::optional<int>(1));
  EXPECT_EQ(pp.vClassicRules[0].oStatusCheckContexts,
            std::optional<std::vector<std::string>>({"ci"}));
  EXPECT_EQ(pp.vClassicRules[0].oEnforceAdmins, std::optional<bool>(true));
  EXPECT_EQ(pp.vClassicRules[0].oRequireSignatures, std::optional<bool>(false));

  ASSERT_EQ(pp.vConflicts.size(), 1u);
  EXPECT_EQ(pp.vConflicts[0].cbpClassic.sBranch, "main");
  EXPECT_EQ(pp.vConflicts[0].rsRuleset.iId, 1);
  ASSERT_EQ(pp.vOrphaned.size(), 1u);
  EXPECT_EQ(pp.vOrphaned[0].sBranch, "develop");
}

TEST(ProtectionCleanupTest, WildcardRulesetsConflictWithEveryBranch) {
  ProtectionPlan pp;
  RulesetSummary rs;
  rs.iId = 3;
  rs.sName = "All branches";
  rs.sTarget = "branch";
  rs.oBranches = std::vector<std::string>{"~ALL"};
  pp.vRulesets.push_back(rs);
  ClassicBranchProtection cbp;
  cbp.sBranch = "release";
  pp.vClassicRules.push_back(cbp);

  ProtectionCleanup::classify(pp);
  EXPECT_EQ(pp.vConflicts.size(), 1u);
  EXPECT_TRUE(pp.vOrphaned.empty());

  pp.vRulesets[0].sTarget = "tag";
  ProtectionCleanup::classify(pp);
  EXPECT_TRUE(pp.vConflicts.empty());
  EXPECT_EQ(pp.vOrphaned.size(), 1u);
}

TEST(ProtectionCleanupTest, PreviewRemovesNothing) {
  FakeGitHubClient fake;
  fake.fnHandler = repoHandler();
  ProtectionCleanup pcl(fake);

  auto co = pcl.runCleanup(kRepo, {"main", "develop"}, false);
  EXPECT_FALSE(co.bApplied);
  EXPECT_TRUE(co.vRemoved.empty());
  for (const auto& rc : fake.calls()) {
    EXPECT_EQ(rc.sMethod, "GET") << rc.sPath;
  }
}

TEST(ProtectionCleanupTest, ApplyRemovesOrphansThenConflicts) {
  FakeGitHubClient fake;
  fake.fnHandler = repoHandler();
  ProtectionCleanup pcl(fake);

  auto co = pcl.runCleanup(kRepo, {"main", "develop"}, true);
  EXPECT_TRUE(co.bApplied);
  EXPECT_EQ(co.vRemoved, (std::vector<std::string>{"develop", "main"}));
  EXPECT_TRUE(fake.wasCalled("DELETE", "repos/acme/widgets/branches/develop/protection"));
  EXPECT_TRUE(fake.wasCalled("DELETE", "repos/acme/widgets/branches/main/protection"));
}

TEST(ProtectionCleanupTest, ClassicReadErrors) {
  FakeGitHubClient fake;
  ProtectionCleanup pcl(fake);

  fake.fnHandler = [](const std::string&, const std::string& sPath,
                      const std::optional<nlohmann::json>&) -> nlohmann::json {
    if (sPath.find("/rulesets") != std::string::npos) return nlohmann::json::array();
    throw gov::test::httpError(403);
  };
  EXPECT_EQ(cleanupCode([&]() { pcl.listAllProtection(kRepo, {"main"}); }), "NO_PERMISSION");

  fake.fnHandler = [](const std::string&, const std::string& sPath,
                      const std::optional<nlohmann::json>&) -> nlohmann::json {
    if (sPath.find("/rulesets") != std::string::npos) return nlohmann::json::array();
    throw gov::test::httpError(502);
  };
  EXPECT_EQ(cleanupCode([&]() { pcl.listAllProtection(kRepo, {"main"}); }), "API_ERROR");
}

TEST(ProtectionCleanupTest, RemoveMapsStatuses) {
  FakeGitHubClient fake;
  ProtectionCleanup pcl(fake);
  for (const auto& [iStatus, sCode] : std::vector<std::pair<int, std::string>>{
           {404, "NOT_FOUND"}, {403, "NO_PERMISSION"}, {500, "API_ERROR"}}) {
    fake.fnHandler = [iStatus = iStatus](const std::string&, const std::string&,
                                         const std::optional<nlohmann::json>&) -> nlohmann::json {
      throw gov::test::httpError(iStatus);
    };
    EXPECT_EQ(cleanupCode([&]() { pcl.removeClassicProtection(kRepo, "main"); }), sCode)
        << iStatus;
  }
}
