#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace gov::common {

/// [process.repo] settings.
/// Class abbreviation: rp
struct RepoPolicy {
  bool bEnabled = false;
  bool bRequireBranchProtection = false;
  bool bRequireCodeowners = false;
  std::optional<DesiredBranchProtection> oRuleset;
};

/// [extends] settings.
/// Class abbreviation: ep
struct ExtendsPolicy {
  std::optional<std::string> oRegistry;
  std::vector<std::string> vRulesets;
};

/// Governance policy declared in check.toml.
/// Class abbreviation: pol
struct Policy {
  RepoPolicy rpRepo;
  std::optional<DesiredTagProtection> oTagProtection;
  std::optional<ExtendsPolicy> oExtends;

  /// Branch named by [process.repo.ruleset].branch, "main" otherwise.
  std::string branch() const {
    if (rpRepo.oRuleset && rpRepo.oRuleset->oBranch) {
      return *rpRepo.oRuleset->oBranch;
    }
    return "main";
  }
};

}  // namespace gov::common
