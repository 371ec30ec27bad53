#include "common/Config.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace gov::common {

namespace {

constexpr int kMaxProbeThreads = 32;

}  // namespace

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  try {
    size_t nPos = 0;
    int iValue = std::stoi(sValue, &nPos);
    if (nPos != sValue.size()) {
      throw std::invalid_argument("trailing characters");
    }
    return iValue;
  } catch (const std::exception&) {
    throw ConfigError(std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
}

Config Config::load() {
  Config cfg;

  const std::string sGhPath = getEnv("GOVERNOR_GH_PATH");
  if (!sGhPath.empty()) {
    cfg.sGhPath = sGhPath;
  }

  const std::string sConfigPath = getEnv("GOVERNOR_CONFIG_PATH");
  if (!sConfigPath.empty()) {
    cfg.sConfigPath = sConfigPath;
  }

  cfg.iProbeThreads = getEnvInt("GOVERNOR_PROBE_THREADS", 4);

  const std::string sFormat = getEnv("GOVERNOR_OUTPUT_FORMAT");
  if (!sFormat.empty()) {
    cfg.sOutputFormat = sFormat;
  }

  const std::string sLogLevel = getEnv("GOVERNOR_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    cfg.sLogLevel = sLogLevel;
  }

  // ── Validation ─────────────────────────────────────────────────────────

  if (cfg.iProbeThreads < 1 || cfg.iProbeThreads > kMaxProbeThreads) {
    throw ConfigError("GOVERNOR_PROBE_THREADS must be between 1 and " +
                      std::to_string(kMaxProbeThreads) + " (got " +
                      std::to_string(cfg.iProbeThreads) + ")");
  }

  if (cfg.sOutputFormat != "text" && cfg.sOutputFormat != "json") {
    throw ConfigError("GOVERNOR_OUTPUT_FORMAT must be 'text' or 'json' (got '" +
                      cfg.sOutputFormat + "')");
  }

  Logger::parseLevel(cfg.sLogLevel);

  return cfg;
}

}  // namespace gov::common
