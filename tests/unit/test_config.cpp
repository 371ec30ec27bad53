#include "common/Config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

#include "common/Errors.hpp"

using namespace gov::common;

namespace {

/// RAII helper to set/unset env vars for tests.
class EnvGuard {
 public:
  explicit EnvGuard(const std::string& sName, const std::string& sValue)
      : _sName(sName) {
    setenv(_sName.c_str(), sValue.c_str(), 1);
  }
  ~EnvGuard() { unsetenv(_sName.c_str()); }
 private:
  std::string _sName;
};

void clearAllGovernorEnv() {
  const char* vVars[] = {"GOVERNOR_GH_PATH",       "GOVERNOR_CONFIG_PATH",
                         "GOVERNOR_PROBE_THREADS", "GOVERNOR_OUTPUT_FORMAT",
                         "GOVERNOR_LOG_LEVEL",     nullptr};
  for (int i = 0; vVars[i] != nullptr; ++i) {
    unsetenv(vVars[i]);
  }
}

}  // namespace

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { clearAllGovernorEnv(); }
  void TearDown() override { clearAllGovernorEnv(); }
};

TEST_F(ConfigTest, DefaultsWhenNothingIsSet) {
  auto cfg = Config::load();
  EXPECT_EQ(cfg.sGhPath, "gh");
  EXPECT_EQ(cfg.sConfigPath, "check.toml");
  EXPECT_EQ(cfg.iProbeThreads, 4);
  EXPECT_EQ(cfg.sOutputFormat, "text");
  EXPECT_EQ(cfg.sLogLevel, "warn");
}

TEST_F(ConfigTest, OverridesFromEnvironment) {
  EnvGuard egGh("GOVERNOR_GH_PATH", "/opt/gh/bin/gh");
  EnvGuard egConfig("GOVERNOR_CONFIG_PATH", "/work/check.toml");
  EnvGuard egThreads("GOVERNOR_PROBE_THREADS", "8");
  EnvGuard egFormat("GOVERNOR_OUTPUT_FORMAT", "json");
  EnvGuard egLevel("GOVERNOR_LOG_LEVEL", "debug");

  auto cfg = Config::load();
  EXPECT_EQ(cfg.sGhPath, "/opt/gh/bin/gh");
  EXPECT_EQ(cfg.sConfigPath, "/work/check.toml");
  EXPECT_EQ(cfg.iProbeThreads, 8);
  EXPECT_EQ(cfg.sOutputFormat, "json");
  EXPECT_EQ(cfg.sLogLevel, "debug");
}

TEST_F(ConfigTest, ProbeThreadsBoundsAreInclusive) {
  {
    EnvGuard eg("GOVERNOR_PROBE_THREADS", "1");
    EXPECT_EQ(Config::load().iProbeThreads, 1);
  }
  {
    EnvGuard eg("GOVERNOR_PROBE_THREADS", "32");
    EXPECT_EQ(Config::load().iProbeThreads, 32);
  }
}

TEST_F(ConfigTest, ProbeThreadsOutOfRangeThrows) {
  {
    EnvGuard eg("GOVERNOR_PROBE_THREADS", "0");
    EXPECT_THROW(Config::load(), ConfigError);
  }
  {
    EnvGuard eg("GOVERNOR_PROBE_THREADS", "33");
    EXPECT_THROW(Config::load(), ConfigError);
  }
}

TEST_F(ConfigTest, NonNumericProbeThreadsThrows) {
  EnvGuard eg("GOVERNOR_PROBE_THREADS", "abc");
  EXPECT_THROW(Config::load(), ConfigError);
}

TEST_F(ConfigTest, TrailingCharactersInIntegerThrow) {
  EnvGuard eg("GOVERNOR_PROBE_THREADS", "4x");
  EXPECT_THROW(Config::load(), ConfigError);
}

TEST_F(ConfigTest, UnknownOutputFormatThrows) {
  EnvGuard eg("GOVERNOR_OUTPUT_FORMAT", "yaml");
  try {
    Config::load();
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_EQ(e._sErrorCode, "CONFIG_ERROR");
    EXPECT_NE(std::string(e.what()).find("yaml"), std::string::npos);
  }
}

TEST_F(ConfigTest, UnknownLogLevelThrows) {
  EnvGuard eg("GOVERNOR_LOG_LEVEL", "verbose");
  EXPECT_THROW(Config::load(), ConfigError);
}
