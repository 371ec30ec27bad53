#include "validate/TierRulesetValidator.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "common/TomlReader.hpp"

#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>

#include <yaml-cpp/yaml.h>

namespace gov::validate {

namespace {

namespace fs = std::filesystem;

/// Tier resolved from repo-metadata.yaml.
struct TierSource {
  std::string sTier = TierRulesetValidator::kDefaultTier;
  std::string sSource = "default";
  std::string sDetail;
  std::optional<std::string> oWarning;
  std::optional<std::string> oInvalidValue;
};

std::string joinNames(const std::vector<std::string>& vNames) {
  std::string sOut;
  for (size_t i = 0; i < vNames.size(); ++i) {
    if (i > 0) sOut += ", ";
    sOut += vNames[i];
  }
  return sOut;
}

TierSource fallback(const std::string& sReason) {
  TierSource ts;
  ts.sDetail = "default (" + sReason + ")";
  return ts;
}

TierSource resolveTier(const fs::path& pthProjectRoot) {
  const fs::path pthMetadata = pthProjectRoot / TierRulesetValidator::kMetadataFile;
  if (!fs::exists(pthMetadata)) {
    return fallback("file not found");
  }

  std::ifstream ifs(pthMetadata);
  std::ostringstream oss;
  oss << ifs.rdbuf();
  const std::string sContent = oss.str();
  if (sContent.find_first_not_of(" \t\r\n") == std::string::npos) {
    return fallback("file empty");
  }

  YAML::Node root;
  try {
    root = YAML::Load(sContent);
  } catch (const YAML::Exception& ex) {
    auto ts = fallback("parse error");
    ts.oWarning = std::string("Failed to parse repo-metadata.yaml: ") + ex.what();
    return ts;
  }

  if (!root.IsMap() || !root["tier"] || root["tier"].IsNull()) {
    return fallback("tier not specified");
  }

  const YAML::Node tier = root["tier"];
  const std::string sValue = tier.IsScalar() ? tier.as<std::string>() : YAML::Dump(tier);
  if (!TierRulesetValidator::isValidTier(sValue)) {
    auto ts = fallback("invalid value");
    ts.oInvalidValue = sValue;
    ts.oWarning = "Invalid tier '" + sValue +
                  "' in repo-metadata.yaml. Valid values are: production, internal, prototype";
    return ts;
  }

  TierSource ts;
  ts.sTier = sValue;
  ts.sSource = TierRulesetValidator::kMetadataFile;
  ts.sDetail = TierRulesetValidator::kMetadataFile;
  return ts;
}

/// [extends] of check.toml; a malformed file counts as having none.
struct ExtendsSection {
  std::optional<std::string> oRegistry;
  std::vector<std::string> vRulesets;
};

std::optional<ExtendsSection> loadExtends(const std::string& sConfigPath) {
  try {
    const auto td = common::TomlDocument::parseFile(sConfigPath);
    if (!td.hasTable("extends")) {
      return std::nullopt;
    }
    ExtendsSection es;
    es.oRegistry = td.getString("extends.registry");
    es.vRulesets = td.getStringArray("extends.rulesets").value_or(std::vector<std::string>{});
    return es;
  } catch (const common::ConfigError& ex) {
    common::Logger::get()->warn("Ignoring [extends] of {}: {}", sConfigPath, ex.what());
    return std::nullopt;
  }
}

}  // namespace

bool TierRulesetValidator::isValidTier(const std::string& sTier) {
  for (const char* pTier : kValidTiers) {
    if (sTier == pTier) return true;
  }
  return false;
}

std::vector<std::string> TierRulesetValidator::findMatchingRulesets(
    const std::vector<std::string>& vRulesets, const std::string& sTier) {
  const std::string sSuffix = "-" + sTier;
  std::vector<std::string> vMatched;
  for (const auto& sRuleset : vRulesets) {
    if (sRuleset.size() >= sSuffix.size() &&
        sRuleset.compare(sRuleset.size() - sSuffix.size(), sSuffix.size(), sSuffix) == 0) {
      vMatched.push_back(sRuleset);
    }
  }
  return vMatched;
}

common::TierValidationResult TierRulesetValidator::validateTierRuleset(
    const std::string& sConfigPath) {
  common::TierValidationResult tvr;

  if (sConfigPath.empty() || !fs::exists(sConfigPath)) {
    tvr.bValid = false;
    tvr.sTier = kDefaultTier;
    tvr.sTierSource = "default";
    tvr.sTierSourceDetail = "default";
    tvr.sExpectedPattern = std::string("*-") + kDefaultTier;
    tvr.oError = "No check.toml found";
    return tvr;
  }

  const fs::path pthRoot = fs::absolute(sConfigPath).parent_path();
  auto ts = resolveTier(pthRoot);
  tvr.sTier = ts.sTier;
  tvr.sTierSource = ts.sSource;
  tvr.sTierSourceDetail = ts.sDetail;
  tvr.oInvalidTierValue = ts.oInvalidValue;
  if (ts.oWarning) {
    tvr.vWarnings.push_back(*ts.oWarning);
  }

  const auto oExtends = loadExtends(sConfigPath);
  if (oExtends) {
    tvr.vRulesets = oExtends->vRulesets;
    if (oExtends->oRegistry && oExtends->vRulesets.empty()) {
      tvr.bHasEmptyRulesets = true;
      tvr.oRegistryUrl = oExtends->oRegistry;
      tvr.vWarnings.push_back("[extends] is configured with registry '" + *oExtends->oRegistry +
                              "' but rulesets is empty - no standards will be inherited");
    }
  }

  tvr.sExpectedPattern = "*-" + tvr.sTier;
  tvr.vMatchedRulesets = findMatchingRulesets(tvr.vRulesets, tvr.sTier);
  tvr.bValid = tvr.vRulesets.empty() || !tvr.vMatchedRulesets.empty();
  if (!tvr.bValid) {
    tvr.oError = "No ruleset matching pattern '" + tvr.sExpectedPattern +
                 "' found. Rulesets: [" + joinNames(tvr.vRulesets) + "]";
  }
  return tvr;
}

}  // namespace gov::validate
