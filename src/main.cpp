#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "common/PolicyLoader.hpp"
#include "core/Applier.hpp"
#include "core/Differ.hpp"
#include "core/ProtectionCleanup.hpp"
#include "core/ProtectionFetcher.hpp"
#include "core/ThreadPool.hpp"
#include "github/GhCliClient.hpp"
#include "output/Formatter.hpp"
#include "scan/RepositoryScanner.hpp"
#include "validate/TierRulesetValidator.hpp"

namespace {

using gov::common::kExitError;
using gov::common::kExitPassed;
using gov::common::kExitViolations;

constexpr const char* kUsage =
    "Usage: governor <command> [args]\n"
    "\n"
    "Commands:\n"
    "  diff                          Show branch protection drift\n"
    "  sync [--apply]                Preview or apply branch protection\n"
    "  tag-diff                      Show tag protection drift\n"
    "  tag-sync [--apply]            Preview or apply tag protection\n"
    "  scan <owner/repo>             Read-only compliance scan of a remote repository\n"
    "  validate-tier                 Check [extends] rulesets against the repository tier\n"
    "  cleanup-rules [--apply] [branch...]\n"
    "                                Remove classic branch protection shadowed by rulesets\n"
    "  help                          Show this message\n"
    "\n"
    "Environment:\n"
    "  GOVERNOR_CONFIG_PATH, GOVERNOR_GH_PATH, GOVERNOR_LOG_LEVEL,\n"
    "  GOVERNOR_OUTPUT_FORMAT, GOVERNOR_PROBE_THREADS\n";

/// Everything a command needs, built once per invocation.
struct Context {
  gov::common::Config cfgApp;
  std::unique_ptr<gov::github::GhCliClient> upClient;
  std::unique_ptr<gov::output::Formatter> upFormatter;
};

bool hasFlag(const std::vector<std::string>& vArgs, const std::string& sFlag) {
  for (const auto& sArg : vArgs) {
    if (sArg == sFlag) return true;
  }
  return false;
}

gov::common::Policy loadPolicy(const Context& ctx) {
  return gov::common::PolicyLoader::loadFile(ctx.cfgApp.sConfigPath);
}

/// diff / sync require gh; without it the command is skipped, not failed.
bool ghOrSkip(Context& ctx) {
  if (ctx.upClient->isAvailable()) {
    return true;
  }
  std::cout << "Skipped: GitHub CLI (gh) not available" << std::endl;
  return false;
}

int runBranchSync(Context& ctx, bool bApply) {
  auto spLog = gov::common::Logger::get();
  const auto pol = loadPolicy(ctx);
  if (!pol.rpRepo.oRuleset) {
    throw gov::common::ConfigError("No [process.repo.ruleset] section in " +
                                   ctx.cfgApp.sConfigPath);
  }
  if (!ghOrSkip(ctx)) {
    return kExitPassed;
  }

  gov::core::ProtectionFetcher pfFetcher(*ctx.upClient);
  const auto riRepo = pfFetcher.getRepoInfo(std::filesystem::current_path().string());
  const std::string sBranch = pol.branch();
  spLog->info("Comparing branch protection of {}/{} ({})", riRepo.sOwner, riRepo.sRepo, sBranch);

  const auto bpsCurrent = pfFetcher.fetchBranchProtection(riRepo, sBranch);
  const auto sdr = gov::core::Differ::computeDiff(riRepo, bpsCurrent, *pol.rpRepo.oRuleset);
  std::cout << ctx.upFormatter->diff(sdr) << std::endl;

  if (!bApply) {
    if (sdr.bHasChanges) {
      std::cout << "\nRun 'governor sync --apply' to apply these changes." << std::endl;
    }
    return kExitPassed;
  }

  gov::core::Applier apApplier(*ctx.upClient);
  const auto sr = apApplier.applyBranchProtection(riRepo, sBranch, *pol.rpRepo.oRuleset, sdr);
  std::cout << ctx.upFormatter->sync(sr) << std::endl;
  return sr.bSuccess ? kExitPassed : kExitViolations;
}

int runTagSync(Context& ctx, bool bApply) {
  const auto pol = loadPolicy(ctx);
  if (!pol.oTagProtection) {
    throw gov::common::ConfigError("Tag protection is not configured in " +
                                   ctx.cfgApp.sConfigPath);
  }
  if (!ghOrSkip(ctx)) {
    return kExitPassed;
  }

  gov::core::ProtectionFetcher pfFetcher(*ctx.upClient);
  const auto riRepo = pfFetcher.getRepoInfo(std::filesystem::current_path().string());
  const auto tpsCurrent = pfFetcher.fetchTagProtection(riRepo);
  const auto tdr = gov::core::Differ::computeTagDiff(riRepo, tpsCurrent, *pol.oTagProtection);
  std::cout << ctx.upFormatter->tagDiff(tdr) << std::endl;

  if (!bApply) {
    if (tdr.bHasChanges) {
      std::cout << "\nRun 'governor tag-sync --apply' to apply these changes." << std::endl;
    }
    return kExitPassed;
  }

  gov::core::Applier apApplier(*ctx.upClient);
  const auto sr = apApplier.applyTagProtection(riRepo, *pol.oTagProtection, tdr);
  std::cout << ctx.upFormatter->sync(sr) << std::endl;
  return sr.bSuccess ? kExitPassed : kExitViolations;
}

int runScan(Context& ctx, const std::vector<std::string>& vArgs) {
  if (vArgs.empty()) {
    throw gov::common::ConfigError("scan requires a repository argument (owner/repo)");
  }

  gov::common::Policy pol;
  if (std::filesystem::exists(ctx.cfgApp.sConfigPath)) {
    pol = loadPolicy(ctx);
  } else {
    gov::common::Logger::get()->warn("{} not found; scanning with the default policy",
                                     ctx.cfgApp.sConfigPath);
  }

  gov::core::ThreadPool tpPool(ctx.cfgApp.iProbeThreads);
  gov::scan::RepositoryScanner rscScanner(*ctx.upClient, tpPool);
  const auto scr = rscScanner.scanRepository(vArgs.front(), pol);
  std::cout << ctx.upFormatter->scan(scr) << std::endl;
  return scr.bPassed ? kExitPassed : kExitViolations;
}

int runValidateTier(Context& ctx) {
  const auto tvr =
      gov::validate::TierRulesetValidator::validateTierRuleset(ctx.cfgApp.sConfigPath);
  std::cout << ctx.upFormatter->tier(tvr) << std::endl;
  return tvr.bValid ? kExitPassed : kExitViolations;
}

int runCleanup(Context& ctx, const std::vector<std::string>& vArgs) {
  if (!ctx.upClient->isAvailable()) {
    throw gov::common::RemoteFetcherError("NO_GH", "GitHub CLI (gh) not available");
  }

  std::vector<std::string> vBranches;
  for (const auto& sArg : vArgs) {
    if (sArg != "--apply") vBranches.push_back(sArg);
  }
  if (vBranches.empty()) {
    vBranches = gov::core::ProtectionCleanup::defaultBranches();
  }

  gov::core::ProtectionFetcher pfFetcher(*ctx.upClient);
  const auto riRepo = pfFetcher.getRepoInfo(std::filesystem::current_path().string());
  gov::core::ProtectionCleanup pclCleanup(*ctx.upClient);
  const auto co = pclCleanup.runCleanup(riRepo, vBranches, hasFlag(vArgs, "--apply"));
  std::cout << ctx.upFormatter->cleanup(co) << std::endl;
  return kExitPassed;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::vector<std::string> vArgs(argv + 1, argv + argc);
  if (vArgs.empty() || vArgs.front() == "help" || vArgs.front() == "--help") {
    std::cout << kUsage;
    return vArgs.empty() ? kExitError : kExitPassed;
  }
  const std::string sCommand = vArgs.front();
  vArgs.erase(vArgs.begin());

  try {
    // ── Configuration and logging ────────────────────────────────────────
    Context ctx;
    ctx.cfgApp = gov::common::Config::load();
    gov::common::Logger::init(ctx.cfgApp.sLogLevel);
    auto spLog = gov::common::Logger::get();
    spLog->debug("Configuration loaded (config={}, gh={})", ctx.cfgApp.sConfigPath,
                 ctx.cfgApp.sGhPath);

    ctx.upClient = std::make_unique<gov::github::GhCliClient>(ctx.cfgApp.sGhPath);
    ctx.upFormatter = std::make_unique<gov::output::Formatter>(
        gov::output::parseOutputFormat(ctx.cfgApp.sOutputFormat));

    // ── Dispatch ──────────────────────────────────────────────────────────
    if (sCommand == "diff") return runBranchSync(ctx, false);
    if (sCommand == "sync") return runBranchSync(ctx, hasFlag(vArgs, "--apply"));
    if (sCommand == "tag-diff") return runTagSync(ctx, false);
    if (sCommand == "tag-sync") return runTagSync(ctx, hasFlag(vArgs, "--apply"));
    if (sCommand == "scan") return runScan(ctx, vArgs);
    if (sCommand == "validate-tier") return runValidateTier(ctx);
    if (sCommand == "cleanup-rules") return runCleanup(ctx, vArgs);

    std::cerr << "Unknown command: " << sCommand << "\n\n" << kUsage;
    return kExitError;
  } catch (const gov::common::AppError& e) {
    gov::common::Logger::get()->error("{} ({})", e.what(), e._sErrorCode);
    std::cerr << "Error [" << e._sErrorCode << "]: " << e.what() << std::endl;
    return e._iExitCode;
  } catch (const std::exception& e) {
    gov::common::Logger::get()->critical("Fatal error: {}", e.what());
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return kExitError;
  }
}
