#include "common/Config.hpp"
#include "common/Errors.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>
#include <string>

#include "fakes/TempDir.hpp"

using namespace cdp::common;
using cdp::test::TempDir;

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

void clearAllCdpEnv() {
  const char* vVars[] = {
      "CDP_PROJECT_ID", "CDP_REGION", "CDP_ZONE", "CDP_MACHINE_TYPE",
      "CDP_DISK_SIZE", "CDP_DISK_TYPE", "CDP_IMAGE_FAMILY", "CDP_IMAGE_PROJECT",
      "CDP_APP_NAME", "CDP_API_KEY_SECRET_NAME", "CDP_APP_ARCHIVE", "CDP_APP_PORT",
      "CDP_BUDGET_AMOUNT_USD", "CDP_READY_POLL_ATTEMPTS",
      "CDP_READY_POLL_INTERVAL_SECONDS", "CDP_STATE_DIR", "CDP_LOG_DIR",
      "CDP_LOG_LEVEL",
      nullptr};
  for (int i = 0; vVars[i] != nullptr; ++i) {
    unsetenv(vVars[i]);
  }
}

void writeFile(const std::string& sPath, const std::string& sContent) {
  std::ofstream ofs(sPath);
  ofs << sContent;
}

}  // namespace

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { clearAllCdpEnv(); }
  void TearDown() override { clearAllCdpEnv(); }

  TempDir _tdConfig;
};

TEST_F(ConfigTest, DefaultsWhenNoEnvFileExists) {
  auto cfg = Config::load("staging", _tdConfig.str());
  EXPECT_EQ(cfg.sEnvironment, "staging");
  EXPECT_TRUE(cfg.sProjectId.empty());
  EXPECT_EQ(cfg.sRegion, "us-central1");
  EXPECT_EQ(cfg.sZone, "us-central1-a");
  EXPECT_EQ(cfg.sMachineType, "e2-micro");
  EXPECT_EQ(cfg.iDiskSizeGb, 30);
  EXPECT_EQ(cfg.sDiskType, "pd-standard");
  EXPECT_EQ(cfg.sAppName, "router");
  EXPECT_FALSE(cfg.oAppArchivePath.has_value());
  EXPECT_EQ(cfg.iAppPort, 3456);
  EXPECT_EQ(cfg.iReadyPollAttempts, 60);
  EXPECT_EQ(cfg.iReadyPollIntervalSeconds, 30);
  EXPECT_FALSE(cfg.bForce);
}

TEST_F(ConfigTest, LoadsEnvironmentFile) {
  writeFile(_tdConfig.str() + "/production.env",
            "# production target\n"
            "export PROJECT_ID=\"my-proj\"\n"
            "REGION=us-east1\n"
            "ZONE='us-east1-b'\n"
            "DISK_SIZE=20GB   # standard disk\n"
            "APP_NAME=gateway\n"
            "APP_ARCHIVE=dist/app.tar.gz\n");
  auto cfg = Config::load("production", _tdConfig.str());
  EXPECT_EQ(cfg.sProjectId, "my-proj");
  EXPECT_EQ(cfg.sRegion, "us-east1");
  EXPECT_EQ(cfg.sZone, "us-east1-b");
  EXPECT_EQ(cfg.iDiskSizeGb, 20);
  EXPECT_EQ(cfg.sAppName, "gateway");
  ASSERT_TRUE(cfg.oAppArchivePath.has_value());
  EXPECT_EQ(*cfg.oAppArchivePath, "dist/app.tar.gz");
  EXPECT_EQ(cfg.resourcePrefix(), "my-proj-gateway");
}

TEST_F(ConfigTest, EnvironmentVariableOverridesFile) {
  writeFile(_tdConfig.str() + "/production.env", "PROJECT_ID=from-file\nAPP_PORT=8080\n");
  EnvGuard eg1("CDP_PROJECT_ID", "from-env");
  EnvGuard eg2("CDP_APP_PORT", "9090");
  auto cfg = Config::load("production", _tdConfig.str());
  EXPECT_EQ(cfg.sProjectId, "from-env");
  EXPECT_EQ(cfg.iAppPort, 9090);
}

TEST_F(ConfigTest, InvalidIntegerThrows) {
  EnvGuard eg("CDP_APP_PORT", "80abc");
  EXPECT_THROW(Config::load("production", _tdConfig.str()), ConfigError);
}

TEST_F(ConfigTest, MalformedEnvLineThrows) {
  writeFile(_tdConfig.str() + "/production.env", "PROJECT_ID=ok\nthis is not a pair\n");
  try {
    Config::load("production", _tdConfig.str());
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_EQ(e._sErrorCode, "invalid_env_file");
    EXPECT_NE(std::string(e.what()).find(":2:"), std::string::npos);
  }
}

TEST_F(ConfigTest, ParseDiskSizeAcceptsSuffixes) {
  EXPECT_EQ(Config::parseDiskSizeGb("30GB"), 30);
  EXPECT_EQ(Config::parseDiskSizeGb("30gb"), 30);
  EXPECT_EQ(Config::parseDiskSizeGb(" 25 "), 25);
  EXPECT_THROW(Config::parseDiskSizeGb("thirty"), ConfigError);
  EXPECT_THROW(Config::parseDiskSizeGb("GB"), ConfigError);
  EXPECT_THROW(Config::parseDiskSizeGb("-5GB"), ConfigError);
}

TEST_F(ConfigTest, ValidateRequiresProject) {
  Config cfg;
  EXPECT_THROW(cfg.validate(), ConfigError);
  cfg.sProjectId = "p";
  EXPECT_NO_THROW(cfg.validate());
}

TEST_F(ConfigTest, ValidateRejectsOutOfRangeValues) {
  Config cfg;
  cfg.sProjectId = "p";

  cfg.iDiskSizeGb = 5;
  EXPECT_THROW(cfg.validate(), ConfigError);
  cfg.iDiskSizeGb = 30;

  cfg.iAppPort = 70000;
  EXPECT_THROW(cfg.validate(), ConfigError);
  cfg.iAppPort = 3456;

  cfg.iReadyPollAttempts = 0;
  EXPECT_THROW(cfg.validate(), ConfigError);
}

TEST_F(ConfigTest, OversizedDiskIsNotAConfigError) {
  // The 30 GB ceiling is a compliance concern, not a configuration one
  Config cfg;
  cfg.sProjectId = "p";
  cfg.iDiskSizeGb = 50;
  EXPECT_NO_THROW(cfg.validate());
}
