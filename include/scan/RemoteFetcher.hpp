#pragma once

#include <string>
#include <vector>

#include "common/Types.hpp"
#include "core/ThreadPool.hpp"
#include "github/IGitHubClient.hpp"

namespace gov::scan {

/// Remote repository probing for scans: identity parsing, access
/// verification and file-existence checks.
/// Class abbreviation: rf
class RemoteFetcher {
 public:
  /// tpPool runs independent file checks concurrently.
  RemoteFetcher(github::IGitHubClient& ghClient, core::ThreadPool& tpPool);
  ~RemoteFetcher();

  /// Split "owner/repo". Throws RemoteFetcherError("INVALID_REPO") unless
  /// there are exactly two non-empty segments.
  static common::RepoInfo parseRepoString(const std::string& sRepoSlug);

  /// Files every scanned repository is expected to carry. CODEOWNERS is
  /// required only when bRequireCodeowners is set.
  static std::vector<common::RemoteFileCheckConfig> standardFileChecks(bool bRequireCodeowners);

  /// Never throws.
  bool isGhAvailable();

  /// GET repos/{owner}/{repo}. Throws RemoteFetcherError NO_REPO (404),
  /// NO_PERMISSION (403) or API_ERROR.
  bool verifyRepoAccess(const common::RepoInfo& riRepo);

  /// False on any failure, never throws.
  bool checkRemoteFileExists(const common::RepoInfo& riRepo, const std::string& sPath);

  /// Results are in the order of vConfigs.
  std::vector<common::RemoteFileCheckResult> checkRemoteFiles(
      const common::RepoInfo& riRepo, const std::vector<common::RemoteFileCheckConfig>& vConfigs);

 private:
  common::RemoteFileCheckResult checkOne(const common::RepoInfo& riRepo,
                                         const common::RemoteFileCheckConfig& rfcConfig);

  github::IGitHubClient& _ghClient;
  core::ThreadPool& _tpPool;
};

}  // namespace gov::scan
