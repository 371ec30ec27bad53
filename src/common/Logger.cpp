#include "common/Logger.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

#include "common/Errors.hpp"

namespace gov::common {

bool Logger::_bInitialized = false;

namespace {
// Probe workers may log before main has initialized the logger
std::mutex mtxInit;
}  // namespace

spdlog::level::level_enum Logger::parseLevel(const std::string& sLevel) {
  if (sLevel == "trace") return spdlog::level::trace;
  if (sLevel == "debug") return spdlog::level::debug;
  if (sLevel == "info") return spdlog::level::info;
  if (sLevel == "warn" || sLevel == "warning") return spdlog::level::warn;
  if (sLevel == "error") return spdlog::level::err;
  if (sLevel == "critical") return spdlog::level::critical;
  if (sLevel == "off") return spdlog::level::off;
  throw ConfigError("Unknown log level '" + sLevel + "'");
}

void Logger::init(const std::string& sLevel) {
  const auto level = parseLevel(sLevel);
  std::lock_guard<std::mutex> lock(mtxInit);
  if (_bInitialized) {
    spdlog::default_logger()->set_level(level);
    return;
  }

  auto spLogger = spdlog::stderr_color_mt("governor");
  spLogger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
  spLogger->set_level(level);
  spdlog::set_default_logger(spLogger);
  _bInitialized = true;
}

std::shared_ptr<spdlog::logger> Logger::get() {
  {
    std::lock_guard<std::mutex> lock(mtxInit);
    if (_bInitialized) {
      return spdlog::default_logger();
    }
  }
  init("warn");
  return spdlog::default_logger();
}

}  // namespace gov::common
