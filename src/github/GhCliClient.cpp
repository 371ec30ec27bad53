#include "github/GhCliClient.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "github/CliProcess.hpp"

#include <regex>
#include <utility>
#include <vector>

namespace gov::github {

namespace {

std::string trim(const std::string& sValue) {
  const auto nBegin = sValue.find_first_not_of(" \t\r\n");
  if (nBegin == std::string::npos) {
    return {};
  }
  const auto nEnd = sValue.find_last_not_of(" \t\r\n");
  return sValue.substr(nBegin, nEnd - nBegin + 1);
}

common::GitHubApiError toApiError(const std::string& sWhat, const ProcessResult& pres) {
  const std::string sDetail = trim(pres.sStderr);
  if (pres.iExitCode == 127) {
    return common::GitHubApiError(0, sWhat + ": gh CLI could not be executed");
  }
  const int iStatus = GhCliClient::parseHttpStatus(sDetail);
  if (iStatus != 0) {
    return common::GitHubApiError(iStatus, "HTTP " + std::to_string(iStatus) + ": " + sDetail);
  }
  return common::GitHubApiError(
      0, sWhat + " failed (exit " + std::to_string(pres.iExitCode) + "): " + sDetail);
}

}  // namespace

GhCliClient::GhCliClient(std::string sGhPath) : _sGhPath(std::move(sGhPath)) {}

GhCliClient::~GhCliClient() = default;

int GhCliClient::parseHttpStatus(const std::string& sStderr) {
  static const std::regex rxStatus(R"(HTTP (\d{3}))");
  std::smatch match;
  if (std::regex_search(sStderr, match, rxStatus)) {
    return std::stoi(match[1].str());
  }
  return 0;
}

bool GhCliClient::isAvailable() {
  const auto pres = runProcess({_sGhPath, "--version"}, "", "");
  return pres.iExitCode == 0;
}

nlohmann::json GhCliClient::request(const std::string& sMethod, const std::string& sPath,
                                    const std::optional<nlohmann::json>& ojBody) {
  std::vector<std::string> vArgs = {_sGhPath, "api", sPath, "--method", sMethod};
  std::string sInput;
  if (ojBody.has_value()) {
    vArgs.emplace_back("--input");
    vArgs.emplace_back("-");
    sInput = ojBody->dump();
  }

  common::Logger::get()->debug("gh api {} {}", sMethod, sPath);
  const auto pres = runProcess(vArgs, sInput, "");
  if (pres.iExitCode != 0) {
    throw toApiError("gh api " + sMethod + " " + sPath, pres);
  }

  if (trim(pres.sStdout).empty()) {
    return nullptr;
  }
  try {
    return nlohmann::json::parse(pres.sStdout);
  } catch (const nlohmann::json::parse_error& ex) {
    throw common::GitHubApiError(
        0, "Invalid JSON response from " + sMethod + " " + sPath + ": " + ex.what());
  }
}

nlohmann::json GhCliClient::viewRepo(const std::string& sProjectRoot) {
  const auto pres =
      runProcess({_sGhPath, "repo", "view", "--json", "owner,name"}, "", sProjectRoot);
  if (pres.iExitCode != 0) {
    throw toApiError("gh repo view", pres);
  }
  try {
    return nlohmann::json::parse(pres.sStdout);
  } catch (const nlohmann::json::parse_error& ex) {
    throw common::GitHubApiError(0, std::string("Invalid JSON from gh repo view: ") + ex.what());
  }
}

}  // namespace gov::github
