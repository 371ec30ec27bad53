#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace gov::common {

/// Process-wide spdlog logger named "governor", writing to stderr.
/// stdout is reserved for reports (text or JSON), so nothing here touches it.
/// Class abbreviation: N/A (static interface)
///
/// Usage:
///   Logger::init(cfgApp.sLogLevel);
///   Logger::get()->info("Applying ruleset to {}/{}", sOwner, sRepo);
class Logger {
 public:
  /// Create the logger on first call; later calls only change the level.
  /// Throws ConfigError for an unknown level name.
  static void init(const std::string& sLevel);

  /// The shared logger. Initializes at "warn" if init() was never called.
  static std::shared_ptr<spdlog::logger> get();

  /// "trace", "debug", "info", "warn", "error", "critical" or "off".
  /// Throws ConfigError otherwise.
  static spdlog::level::level_enum parseLevel(const std::string& sLevel);

 private:
  static bool _bInitialized;
};

}  // namespace gov::common
