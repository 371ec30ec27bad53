#pragma once

#include <string>

namespace gov::common {

/// Environment variable loader for the governor CLI.
/// Loads all env vars into a typed struct with validation.
/// Class abbreviation: cfg
struct Config {
  // ── GitHub CLI ────────────────────────────────────────────────────────
  std::string sGhPath = "gh";

  // ── Policy ────────────────────────────────────────────────────────────
  std::string sConfigPath = "check.toml";

  // ── Remote probing ────────────────────────────────────────────────────
  int iProbeThreads = 4;

  // ── Output ────────────────────────────────────────────────────────────
  std::string sOutputFormat = "text";  // "text" | "json"

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "warn";

  /// Load and validate all config from environment variables.
  /// Throws ConfigError on invalid values.
  static Config load();

 private:
  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);
};

}  // namespace gov::common
