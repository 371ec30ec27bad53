#include "github/ApiErrors.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using gov::common::GitHubApiError;
using namespace gov::github;

TEST(ApiErrorsTest, KnownStatusDecidesAlone) {
  EXPECT_TRUE(isForbidden(GitHubApiError(403, "HTTP 403: Forbidden")));
  EXPECT_FALSE(isForbidden(GitHubApiError(500, "HTTP 500: rulesets/14032")));
  EXPECT_FALSE(isNotFound(GitHubApiError(403, "HTTP 403: repos/acme/svc-404")));
  EXPECT_TRUE(isNotFound(GitHubApiError(404, "HTTP 404: Not Found")));
}

TEST(ApiErrorsTest, StatuslessMessagesNeedGhMarkers) {
  EXPECT_TRUE(isForbidden(GitHubApiError(0, "gh: Forbidden (HTTP 403)")));
  EXPECT_TRUE(isForbidden(GitHubApiError(0, "Must have admin rights to Repository.")));
  EXPECT_TRUE(isNotFound(GitHubApiError(0, "gh: Not Found (HTTP 404)")));
  EXPECT_FALSE(isForbidden(GitHubApiError(0, "rulesets/40321 failed")));
  EXPECT_FALSE(isNotFound(GitHubApiError(0, "repos/acme/svc-404 failed")));
}

TEST(ApiErrorsTest, PlainExceptionsHaveNoStatus) {
  const std::runtime_error ex("HTTP 404 somewhere");
  EXPECT_EQ(httpStatusOf(ex), 0);
  EXPECT_TRUE(isNotFound(ex));
  EXPECT_FALSE(isForbidden(ex));
}
