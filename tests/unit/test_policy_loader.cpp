#include "common/PolicyLoader.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "common/Errors.hpp"

using namespace gov::common;

TEST(PolicyLoaderTest, EmptyDocumentGivesDefaults) {
  auto pol = PolicyLoader::fromDocument(TomlDocument::parse(""));
  EXPECT_FALSE(pol.rpRepo.bEnabled);
  EXPECT_FALSE(pol.rpRepo.bRequireBranchProtection);
  EXPECT_FALSE(pol.rpRepo.bRequireCodeowners);
  EXPECT_FALSE(pol.rpRepo.oRuleset.has_value());
  EXPECT_FALSE(pol.oTagProtection.has_value());
  EXPECT_FALSE(pol.oExtends.has_value());
  EXPECT_EQ(pol.branch(), "main");
}

TEST(PolicyLoaderTest, ReadsRepoPolicyAndRuleset) {
  auto pol = PolicyLoader::fromDocument(TomlDocument::parse(R"(
[process.repo]
enabled = true
require_branch_protection = true
require_codeowners = true

[process.repo.ruleset]
branch = "trunk"
required_reviews = 2
dismiss_stale_reviews = true
require_status_checks = ["ci", "lint"]
require_branches_up_to_date = true
enforce_admins = false
)"));

  EXPECT_TRUE(pol.rpRepo.bEnabled);
  EXPECT_TRUE(pol.rpRepo.bRequireBranchProtection);
  EXPECT_TRUE(pol.rpRepo.bRequireCodeowners);
  ASSERT_TRUE(pol.rpRepo.oRuleset.has_value());
  const auto& dbp = *pol.rpRepo.oRuleset;
  EXPECT_EQ(dbp.oRequiredReviews, std::optional<int>(2));
  EXPECT_EQ(dbp.oDismissStaleReviews, std::optional<bool>(true));
  EXPECT_FALSE(dbp.oRequireCodeOwnerReviews.has_value());
  EXPECT_EQ(dbp.oRequireStatusChecks,
            std::optional<std::vector<std::string>>(std::vector<std::string>{"ci", "lint"}));
  EXPECT_EQ(dbp.oRequireBranchesUpToDate, std::optional<bool>(true));
  EXPECT_FALSE(dbp.oRequireSignedCommits.has_value());
  EXPECT_EQ(dbp.oEnforceAdmins, std::optional<bool>(false));
  EXPECT_EQ(pol.branch(), "trunk");
}

TEST(PolicyLoaderTest, TagProtectionEnabledByDefaultWhenPresent) {
  auto pol = PolicyLoader::fromDocument(TomlDocument::parse(R"(
[process.tag_protection]
patterns = ["v*", "release-*"]
prevent_update = false
)"));
  ASSERT_TRUE(pol.oTagProtection.has_value());
  EXPECT_EQ(pol.oTagProtection->oPatterns,
            std::optional<std::vector<std::string>>(std::vector<std::string>{"v*", "release-*"}));
  EXPECT_FALSE(pol.oTagProtection->oPreventDeletion.has_value());
  EXPECT_EQ(pol.oTagProtection->oPreventUpdate, std::optional<bool>(false));
}

TEST(PolicyLoaderTest, DisabledTagProtectionIsIgnored) {
  auto pol = PolicyLoader::fromDocument(TomlDocument::parse(R"(
[process.tag_protection]
enabled = false
patterns = ["v*"]
)"));
  EXPECT_FALSE(pol.oTagProtection.has_value());
}

TEST(PolicyLoaderTest, ReadsExtends) {
  auto pol = PolicyLoader::fromDocument(TomlDocument::parse(R"(
[extends]
registry = "github:acme/standards"
rulesets = ["base", "typescript-internal"]
)"));
  ASSERT_TRUE(pol.oExtends.has_value());
  EXPECT_EQ(pol.oExtends->oRegistry, std::optional<std::string>("github:acme/standards"));
  EXPECT_EQ(pol.oExtends->vRulesets, (std::vector<std::string>{"base", "typescript-internal"}));
}

TEST(PolicyLoaderTest, WrongTypesThrow) {
  EXPECT_THROW(PolicyLoader::fromDocument(
                   TomlDocument::parse("[process.repo]\nenabled = \"yes\"\n")),
               ConfigError);
  EXPECT_THROW(PolicyLoader::fromDocument(
                   TomlDocument::parse("[process.repo.ruleset]\nrequired_reviews = -1\n")),
               ConfigError);
  EXPECT_THROW(PolicyLoader::fromDocument(TomlDocument::parse(
                   "[process.repo.ruleset]\nrequire_status_checks = \"ci\"\n")),
               ConfigError);
}

TEST(PolicyLoaderTest, MissingFileThrows) {
  EXPECT_THROW(PolicyLoader::loadFile("/nonexistent/governor/check.toml"), ConfigError);
}
