#include "dal/StateStore.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "common/Errors.hpp"
#include "fakes/TempDir.hpp"

using namespace cdp::dal;
using cdp::common::MissingStateError;
namespace fs = std::filesystem;

namespace {

DeploymentState sampleState() {
  DeploymentState ds;
  ds.oInstance = InstanceIdentity{"p-router-vm", "us-central1-a", "10.0.1.10", "203.0.113.10"};
  ds.oCredential = CredentialRef{"p-router-api-key", "p-router-sa@p.iam.gserviceaccount.com",
                                 "sha256:0123456789abcdef"};
  ds.oReport = DeploymentReport{"2026-01-01 12:00:00", "production",    "p",
                                "http://203.0.113.10", "https://203.0.113.10",
                                "https://203.0.113.10/health"};
  return ds;
}

std::string slurp(const fs::path& path) {
  std::ifstream ifs(path);
  std::stringstream ss;
  ss << ifs.rdbuf();
  return ss.str();
}

}  // namespace

class StateStoreTest : public ::testing::Test {
 protected:
  cdp::test::TempDir _td;
};

TEST_F(StateStoreTest, ReadMissingKeyNamesProducer) {
  StateStore ss(_td.str(), "production");
  try {
    ss.read("INSTANCE_NAME");
    FAIL() << "expected MissingStateError";
  } catch (const MissingStateError& e) {
    EXPECT_EQ(e._sMissingKey, "INSTANCE_NAME");
    EXPECT_EQ(e._iExitCode, 6);
    EXPECT_NE(std::string(e.what()).find("phase 2"), std::string::npos);
  }
}

TEST_F(StateStoreTest, UnknownKeyThrows) {
  StateStore ss(_td.str(), "production");
  EXPECT_THROW(ss.read("NOT_A_KEY"), MissingStateError);
}

TEST_F(StateStoreTest, WriteThenReadKey) {
  StateStore ss(_td.str(), "production");
  auto ds = sampleState();
  ss.write(2, StateField::InstanceIdentity, ds);
  EXPECT_TRUE(ss.exists(StateField::InstanceIdentity));
  EXPECT_EQ(ss.read("INSTANCE_NAME"), "p-router-vm");
  EXPECT_EQ(ss.read("EXTERNAL_IP"), "203.0.113.10");
  EXPECT_EQ(ss.pathFor(StateField::InstanceIdentity),
            _td.path() / "production" / "instance-info.env");
  EXPECT_NE(slurp(ss.pathFor(StateField::InstanceIdentity)).find("ZONE=\"us-central1-a\""),
            std::string::npos);
}

TEST_F(StateStoreTest, EnvironmentsAreIsolated) {
  StateStore ssProd(_td.str(), "production");
  StateStore ssStaging(_td.str(), "staging");
  ssProd.write(2, StateField::InstanceIdentity, sampleState());
  EXPECT_THROW(ssStaging.read("INSTANCE_NAME"), MissingStateError);
}

TEST_F(StateStoreTest, WritingAbsentFieldThrows) {
  StateStore ss(_td.str(), "production");
  DeploymentState ds;
  EXPECT_THROW(ss.write(3, StateField::CredentialRef, ds), MissingStateError);
  EXPECT_FALSE(ss.exists(StateField::CredentialRef));
}

TEST_F(StateStoreTest, CredentialFileIsOwnerOnly) {
  StateStore ss(_td.str(), "production");
  ss.write(3, StateField::CredentialRef, sampleState());
  const auto perms = fs::status(ss.pathFor(StateField::CredentialRef)).permissions();
  EXPECT_EQ(perms & fs::perms::all, fs::perms::owner_read | fs::perms::owner_write);
}

TEST_F(StateStoreTest, CredentialFileHoldsFingerprintOnly) {
  StateStore ss(_td.str(), "production");
  ss.write(3, StateField::CredentialRef, sampleState());
  const std::string sContent = slurp(ss.pathFor(StateField::CredentialRef));
  EXPECT_NE(sContent.find("KEY_FINGERPRINT=\"sha256:0123456789abcdef\""), std::string::npos);
  EXPECT_EQ(sContent.find("API_KEY=\""), std::string::npos);
}

TEST_F(StateStoreTest, LoadRebuildsTypedState) {
  {
    StateStore ss(_td.str(), "production");
    auto ds = sampleState();
    ss.write(2, StateField::InstanceIdentity, ds);
    ss.write(3, StateField::CredentialRef, ds);
  }
  StateStore ss(_td.str(), "production");
  auto ds = ss.load();
  ASSERT_TRUE(ds.has(StateField::InstanceIdentity));
  ASSERT_TRUE(ds.has(StateField::CredentialRef));
  EXPECT_FALSE(ds.has(StateField::DeploymentReport));
  EXPECT_EQ(ds.instance().sInternalIp, "10.0.1.10");
  EXPECT_EQ(ds.credential().sSecretName, "p-router-api-key");
  EXPECT_THROW(ds.report(), MissingStateError);
}

TEST_F(StateStoreTest, RemoveAllDeletesFilesAndDirectory) {
  StateStore ss(_td.str(), "production");
  auto ds = sampleState();
  ss.write(2, StateField::InstanceIdentity, ds);
  ss.write(4, StateField::DeploymentReport, ds);
  auto vRemoved = ss.removeAll();
  EXPECT_EQ(vRemoved.size(), 2u);
  EXPECT_FALSE(fs::exists(ss.directory()));
  EXPECT_TRUE(ss.removeAll().empty());
}

TEST(DeploymentStateTest, RequireNamesPrimaryKey) {
  DeploymentState ds;
  try {
    ds.require(StateField::CredentialRef);
    FAIL() << "expected MissingStateError";
  } catch (const MissingStateError& e) {
    EXPECT_EQ(e._sMissingKey, "API_KEY_SECRET_NAME");
  }
  EXPECT_EQ(fieldInfo(StateField::DeploymentReport).iProducerPhase, 4);
  EXPECT_TRUE(fieldInfo(StateField::CredentialRef).bSensitive);
  EXPECT_EQ(allStateFields().size(), 3u);
}
