#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace gov::common {

/// Process exit codes used by the governor CLI.
inline constexpr int kExitPassed = 0;
inline constexpr int kExitViolations = 1;
inline constexpr int kExitError = 2;

/// Base error for all application-level exceptions.
/// Carries the process exit code and machine-readable error code slug.
struct AppError : public std::runtime_error {
  int _iExitCode;
  std::string _sErrorCode;

  explicit AppError(int iExitCode, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iExitCode(iExitCode),
        _sErrorCode(std::move(sCode)) {}
};

/// Invalid environment configuration or malformed policy file.
struct ConfigError : AppError {
  explicit ConfigError(std::string sMsg)
      : AppError(kExitError, "CONFIG_ERROR", std::move(sMsg)) {}
};

/// Transport-level failure of a GitHub API request.
/// _iHttpStatus is 0 when the failure carried no HTTP status (process error,
/// unparseable output).
struct GitHubApiError : AppError {
  int _iHttpStatus;

  explicit GitHubApiError(int iHttpStatus, std::string sMsg)
      : AppError(kExitError, "API_ERROR", std::move(sMsg)), _iHttpStatus(iHttpStatus) {}
};

/// Remote read failure: INVALID_REPO, NO_GH, NO_REPO, NO_PERMISSION, API_ERROR.
struct RemoteFetcherError : AppError {
  explicit RemoteFetcherError(std::string sCode, std::string sMsg)
      : AppError(kExitError, std::move(sCode), std::move(sMsg)) {}
};

/// Fatal apply failure. Only NO_PERMISSION is thrown; other apply failures are
/// reported through SyncResult::vFailed.
struct ApplierError : AppError {
  explicit ApplierError(std::string sCode, std::string sMsg)
      : AppError(kExitError, std::move(sCode), std::move(sMsg)) {}
};

/// Classic branch protection cleanup failure: NO_PERMISSION, API_ERROR, NOT_FOUND.
struct CleanupError : AppError {
  explicit CleanupError(std::string sCode, std::string sMsg)
      : AppError(kExitError, std::move(sCode), std::move(sMsg)) {}
};

}  // namespace gov::common
