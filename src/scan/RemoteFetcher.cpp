#include "scan/RemoteFetcher.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "github/ApiErrors.hpp"

#include <future>

namespace gov::scan {

RemoteFetcher::RemoteFetcher(github::IGitHubClient& ghClient, core::ThreadPool& tpPool)
    : _ghClient(ghClient), _tpPool(tpPool) {}

RemoteFetcher::~RemoteFetcher() = default;

common::RepoInfo RemoteFetcher::parseRepoString(const std::string& sRepoSlug) {
  const auto nSlash = sRepoSlug.find('/');
  const bool bValid = nSlash != std::string::npos && nSlash > 0 &&
                      nSlash + 1 < sRepoSlug.size() &&
                      sRepoSlug.find('/', nSlash + 1) == std::string::npos;
  if (!bValid) {
    throw common::RemoteFetcherError(
        "INVALID_REPO",
        "Invalid repository format: '" + sRepoSlug + "'. Expected \"owner/repo\" format");
  }
  return common::RepoInfo{sRepoSlug.substr(0, nSlash), sRepoSlug.substr(nSlash + 1)};
}

std::vector<common::RemoteFileCheckConfig> RemoteFetcher::standardFileChecks(
    bool bRequireCodeowners) {
  return {
      {"CODEOWNERS", {".github/CODEOWNERS", "docs/CODEOWNERS"}, bRequireCodeowners,
       "CODEOWNERS file"},
      {"README.md", {}, false, "Repository README"},
      {"CONTRIBUTING.md", {".github/CONTRIBUTING.md"}, false, "Contribution guidelines"},
      {"SECURITY.md", {".github/SECURITY.md"}, false, "Security policy"},
  };
}

bool RemoteFetcher::isGhAvailable() {
  try {
    return _ghClient.isAvailable();
  } catch (const std::exception& ex) {
    common::Logger::get()->debug("gh availability probe failed: {}", ex.what());
    return false;
  }
}

bool RemoteFetcher::verifyRepoAccess(const common::RepoInfo& riRepo) {
  const std::string sRepo = riRepo.sOwner + "/" + riRepo.sRepo;
  try {
    _ghClient.request("GET", "repos/" + sRepo, std::nullopt);
    return true;
  } catch (const std::exception& ex) {
    if (github::isNotFound(ex)) {
      throw common::RemoteFetcherError("NO_REPO",
                                       "Repository not found or not accessible: " + sRepo);
    }
    if (github::isForbidden(ex)) {
      throw common::RemoteFetcherError("NO_PERMISSION",
                                       "Insufficient permissions to access repository: " + sRepo);
    }
    throw common::RemoteFetcherError("API_ERROR", "Failed to verify repository access for " +
                                                      sRepo + ": " + ex.what());
  }
}

bool RemoteFetcher::checkRemoteFileExists(const common::RepoInfo& riRepo,
                                          const std::string& sPath) {
  try {
    _ghClient.request("GET", "repos/" + riRepo.sOwner + "/" + riRepo.sRepo + "/contents/" + sPath,
                      std::nullopt);
    return true;
  } catch (const std::exception& ex) {
    common::Logger::get()->debug("{} not found on {}/{}: {}", sPath, riRepo.sOwner,
                                 riRepo.sRepo, ex.what());
    return false;
  }
}

common::RemoteFileCheckResult RemoteFetcher::checkOne(
    const common::RepoInfo& riRepo, const common::RemoteFileCheckConfig& rfcConfig) {
  common::RemoteFileCheckResult rfr;
  rfr.sPath = rfcConfig.sPath;

  std::vector<std::string> vCandidates = {rfcConfig.sPath};
  vCandidates.insert(vCandidates.end(), rfcConfig.vAlternativePaths.begin(),
                     rfcConfig.vAlternativePaths.end());

  for (const auto& sCandidate : vCandidates) {
    rfr.vCheckedPaths.push_back(sCandidate);
    if (checkRemoteFileExists(riRepo, sCandidate)) {
      rfr.bExists = true;
      break;
    }
  }
  return rfr;
}

std::vector<common::RemoteFileCheckResult> RemoteFetcher::checkRemoteFiles(
    const common::RepoInfo& riRepo, const std::vector<common::RemoteFileCheckConfig>& vConfigs) {
  std::vector<std::future<common::RemoteFileCheckResult>> vFutures;
  vFutures.reserve(vConfigs.size());
  for (const auto& rfcConfig : vConfigs) {
    vFutures.push_back(
        _tpPool.submit([this, &riRepo, &rfcConfig]() { return checkOne(riRepo, rfcConfig); }));
  }

  std::vector<common::RemoteFileCheckResult> vResults;
  vResults.reserve(vFutures.size());
  for (auto& fut : vFutures) {
    vResults.push_back(fut.get());
  }
  return vResults;
}

}  // namespace gov::scan
