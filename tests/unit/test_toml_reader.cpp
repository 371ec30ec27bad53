#include "common/TomlReader.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "common/Errors.hpp"

using gov::common::ConfigError;
using gov::common::TomlDocument;

TEST(TomlReaderTest, ReadsScalarsInTables) {
  auto td = TomlDocument::parse(R"(
# policy
[process.repo]
enabled = true          # inline comment
require_codeowners = false

[process.repo.ruleset]
branch = "develop"
required_reviews = 2
)");

  EXPECT_TRUE(td.hasTable("process.repo"));
  EXPECT_TRUE(td.hasTable("process"));
  EXPECT_FALSE(td.hasTable("extends"));
  EXPECT_EQ(td.getBool("process.repo.enabled"), std::optional<bool>(true));
  EXPECT_EQ(td.getBool("process.repo.require_codeowners"), std::optional<bool>(false));
  EXPECT_EQ(td.getString("process.repo.ruleset.branch"), std::optional<std::string>("develop"));
  EXPECT_EQ(td.getInt("process.repo.ruleset.required_reviews"), std::optional<int64_t>(2));
  EXPECT_FALSE(td.getInt("process.repo.ruleset.missing").has_value());
}

TEST(TomlReaderTest, ReadsMultiLineStringArrays) {
  auto td = TomlDocument::parse(R"(
[process.repo.ruleset]
require_status_checks = [
  "build",   # compile
  'lint',
  "test # not a comment",
]
)");
  EXPECT_EQ(td.getStringArray("process.repo.ruleset.require_status_checks"),
            std::optional<std::vector<std::string>>(
                std::vector<std::string>{"build", "lint", "test # not a comment"}));
}

TEST(TomlReaderTest, StringEscapesAndIntegerForms) {
  auto td = TomlDocument::parse(
      "a = \"line\\n\\\"quoted\\\"\"\n"
      "b = 1_000\n"
      "c = -5\n"
      "d = +7\n");
  EXPECT_EQ(td.getString("a"), std::optional<std::string>("line\n\"quoted\""));
  EXPECT_EQ(td.getInt("b"), std::optional<int64_t>(1000));
  EXPECT_EQ(td.getInt("c"), std::optional<int64_t>(-5));
  EXPECT_EQ(td.getInt("d"), std::optional<int64_t>(7));
}

TEST(TomlReaderTest, UnrelatedValueKindsAreTolerated) {
  auto td = TomlDocument::parse(R"(
[code.linting]
ratio = 0.5
since = 2024-01-01
rules = { "no-console" = "error" }
matrix = [[1, 2], [3]]
doc = """
multi
line
"""

[[code.tools]]
name = "eslint"

[extends]
rulesets = ["base"]
)");
  EXPECT_TRUE(td.has("code.linting.ratio"));
  EXPECT_TRUE(td.has("code.linting.matrix"));
  EXPECT_FALSE(td.has("code.tools.name"));
  EXPECT_EQ(td.getStringArray("extends.rulesets"),
            std::optional<std::vector<std::string>>(std::vector<std::string>{"base"}));
  EXPECT_THROW(td.getString("code.linting.ratio"), ConfigError);
}

TEST(TomlReaderTest, TypeMismatchThrows) {
  auto td = TomlDocument::parse("enabled = \"yes\"\ncount = 3\n");
  EXPECT_THROW(td.getBool("enabled"), ConfigError);
  EXPECT_THROW(td.getStringArray("count"), ConfigError);
}

TEST(TomlReaderTest, MalformedInputReportsLine) {
  try {
    TomlDocument::parse("[ok]\na = 1\nb = \"unterminated\n");
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_NE(std::string(e.what()).find("line 3"), std::string::npos) << e.what();
  }
  EXPECT_THROW(TomlDocument::parse("key_without_value\n"), ConfigError);
  EXPECT_THROW(TomlDocument::parse("a = 1\na = 2\n"), ConfigError);
  EXPECT_THROW(TomlDocument::parse("a = 1 2\n"), ConfigError);
  EXPECT_THROW(TomlDocument::parse("a = [\"x\"\n"), ConfigError);
}

TEST(TomlReaderTest, MissingFileThrows) {
  EXPECT_THROW(TomlDocument::parseFile("/nonexistent/governor/check.toml"), ConfigError);
}
