#pragma once

#include <array>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace gov::validate {

/// Checks that the rulesets a project extends match its declared tier.
/// The tier comes from repo-metadata.yaml next to check.toml. Never throws:
/// unreadable inputs fall back to the default tier and are reported as
/// warnings on the result.
/// Class abbreviation: trv
class TierRulesetValidator {
 public:
  static constexpr std::array<const char*, 3> kValidTiers = {"production", "internal",
                                                             "prototype"};
  static constexpr const char* kDefaultTier = "internal";
  static constexpr const char* kMetadataFile = "repo-metadata.yaml";

  static common::TierValidationResult validateTierRuleset(const std::string& sConfigPath);

  /// Entries of vRulesets that end with "-<tier>".
  static std::vector<std::string> findMatchingRulesets(const std::vector<std::string>& vRulesets,
                                                       const std::string& sTier);

  static bool isValidTier(const std::string& sTier);
};

}  // namespace gov::validate
