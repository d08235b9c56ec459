#include "cloud/GcloudClient.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

#include "common/Errors.hpp"
#include "core/ResourceCatalog.hpp"
#include "fakes/FakeProcessRunner.hpp"

using namespace cdp::cloud;
using cdp::common::CloudCommandError;
using cdp::common::Config;
using cdp::test::FakeProcessRunner;

namespace {

bool contains(const std::vector<std::string>& vArgv, const std::string& sArg) {
  return std::find(vArgv.begin(), vArgv.end(), sArg) != vArgv.end();
}

std::string argWithPrefix(const std::vector<std::string>& vArgv, const std::string& sPrefix) {
  for (const auto& s : vArgv) {
    if (s.rfind(sPrefix, 0) == 0) return s.substr(sPrefix.size());
  }
  return {};
}

const char* kInstanceJson = R"({
  "name": "p-router-vm",
  "zone": "https://www.googleapis.com/compute/v1/projects/p/zones/us-central1-a",
  "machineType": "https://www.googleapis.com/compute/v1/projects/p/zones/us-central1-a/machineTypes/e2-micro",
  "status": "RUNNING",
  "networkInterfaces": [
    {"networkIP": "10.0.1.10", "accessConfigs": [{"natIP": "203.0.113.10"}]}
  ]
})";

}  // namespace

class GcloudClientTest : public ::testing::Test {
 protected:
  void SetUp() override { _cfg.sProjectId = "p"; }

  Config _cfg;
  FakeProcessRunner _fpr;
};

TEST_F(GcloudClientTest, EveryCallIsQuietAndPinnedToProject) {
  GcloudCli gc(_fpr, "p");
  auto vArgv = gc.argv({"compute", "networks", "list"});
  EXPECT_EQ(vArgv.front(), "gcloud");
  EXPECT_TRUE(contains(vArgv, "--quiet"));
  EXPECT_EQ(vArgv.back(), "--project=p");

  GcloudCli gcNoProject(_fpr, "");
  EXPECT_EQ(gcNoProject.argv({"version"}).back(), "--quiet");
}

TEST_F(GcloudClientTest, ExistsUsesDescribeExitCode) {
  GcloudClient gcc(_fpr, "p");
  cdp::core::ResourceCatalog rc(_cfg);
  const auto rdSubnet = rc.subnet();

  _fpr.enqueue(0, "{}");
  EXPECT_TRUE(gcc.exists(rdSubnet));
  const auto& vArgv = _fpr.vInvocations.back();
  EXPECT_TRUE(contains(vArgv, "describe"));
  EXPECT_TRUE(contains(vArgv, rdSubnet.sName));
  EXPECT_TRUE(contains(vArgv, "--region=us-central1"));

  _fpr.enqueue(1, "", "ERROR: (gcloud.compute.networks.subnets.describe) not found");
  EXPECT_FALSE(gcc.exists(rdSubnet));
}

TEST_F(GcloudClientTest, ExistsRaisesWhenDescribeFailsForOtherReasons) {
  GcloudClient gcc(_fpr, "p");
  cdp::core::ResourceCatalog rc(_cfg);

  _fpr.enqueue(1, "",
               "ERROR: (gcloud.compute.networks.describe) There was a problem refreshing "
               "your current auth tokens: invalid_grant\n");
  EXPECT_THROW(gcc.exists(rc.network()), CloudCommandError);

  _fpr.enqueue(1, "",
               "ERROR: (gcloud.compute.networks.describe) Could not fetch resource:\n"
               " - The resource 'projects/p/global/networks/x' was not found\n");
  EXPECT_FALSE(gcc.exists(rc.network()));
}

TEST_F(GcloudClientTest, SecretExistsDistinguishesNotFound) {
  GcloudClient gcc(_fpr, "p");
  cdp::core::ResourceCatalog rc(_cfg);

  _fpr.enqueue(1, "", "ERROR: (gcloud.secrets.describe) NOT_FOUND: Secret [s] not found.\n");
  EXPECT_FALSE(gcc.exists(rc.apiKeySecret()));

  _fpr.enqueue(1, "", "ERROR: (gcloud.secrets.describe) PERMISSION_DENIED: denied\n");
  EXPECT_THROW(gcc.exists(rc.apiKeySecret()), CloudCommandError);
}

TEST(GcloudCliTest, NotFoundDetection) {
  EXPECT_TRUE(GcloudCli::isNotFound("NOT_FOUND: Unknown service account"));
  EXPECT_TRUE(GcloudCli::isNotFound(" - The resource 'x' was not found"));
  EXPECT_FALSE(GcloudCli::isNotFound("ERROR: Quota 'NETWORKS' exceeded."));
  EXPECT_FALSE(GcloudCli::isNotFound(""));
}

TEST_F(GcloudClientTest, ServiceAccountAddressedByEmail) {
  GcloudClient gcc(_fpr, "p");
  cdp::core::ResourceCatalog rc(_cfg);
  gcc.exists(rc.serviceAccount());
  EXPECT_TRUE(_fpr.lastHas(rc.serviceAccountEmail()));
}

TEST_F(GcloudClientTest, RemoveTurnsDescribeIntoDelete) {
  GcloudClient gcc(_fpr, "p");
  cdp::core::ResourceCatalog rc(_cfg);
  EXPECT_TRUE(gcc.remove(rc.disk()));
  const auto& vArgv = _fpr.vInvocations.back();
  EXPECT_TRUE(contains(vArgv, "delete"));
  EXPECT_FALSE(contains(vArgv, "describe"));
  EXPECT_TRUE(contains(vArgv, "--zone=us-central1-a"));
}

TEST_F(GcloudClientTest, MonitoringObjectsFoundByDisplayName) {
  GcloudClient gcc(_fpr, "p");
  cdp::core::ResourceCatalog rc(_cfg);
  const auto rdDashboard = rc.dashboard();

  _fpr.enqueue(0, "[]");
  EXPECT_FALSE(gcc.exists(rdDashboard));
  EXPECT_TRUE(_fpr.lastHas("--filter=displayName=\"" + rdDashboard.sName + "\""));

  _fpr.enqueue(0, R"([{"name": "projects/1/dashboards/abc"}])");
  EXPECT_TRUE(gcc.exists(rdDashboard));
}

TEST_F(GcloudClientTest, DashboardDeleteUsesServerName) {
  GcloudClient gcc(_fpr, "p");
  cdp::core::ResourceCatalog rc(_cfg);
  _fpr.enqueue(0, R"([{"name": "projects/1/dashboards/abc"}])");
  _fpr.enqueue(0);
  EXPECT_TRUE(gcc.remove(rc.dashboard()));
  EXPECT_TRUE(_fpr.lastHas("abc"));
  EXPECT_TRUE(_fpr.lastHas("delete"));
}

TEST_F(GcloudClientTest, CreateFailureCarriesStderr) {
  GcloudClient gcc(_fpr, "p");
  cdp::core::ResourceCatalog rc(_cfg);
  _fpr.enqueue(1, "", "ERROR: Quota 'NETWORKS' exceeded.\n");
  auto cr = gcc.create(rc.network());
  EXPECT_FALSE(cr.bSuccess);
  EXPECT_NE(cr.sErrorMessage.find("Quota 'NETWORKS' exceeded"), std::string::npos);
}

TEST_F(GcloudClientTest, InstanceCreateReturnsAddressesAndRemovesScriptFile) {
  GcloudClient gcc(_fpr, "p");
  cdp::core::ResourceCatalog rc(_cfg);
  _fpr.enqueue(0, std::string("[") + kInstanceJson + "]");
  auto cr = gcc.create(rc.instance());
  ASSERT_TRUE(cr.bSuccess) << cr.sErrorMessage;
  EXPECT_EQ(cr.mAttributes["internalIp"], "10.0.1.10");
  EXPECT_EQ(cr.mAttributes["externalIp"], "203.0.113.10");

  const auto& vArgv = _fpr.vInvocations.back();
  EXPECT_TRUE(contains(vArgv, "--machine-type=e2-micro"));
  EXPECT_TRUE(contains(vArgv, "--format=json"));
  const std::string sScript = argWithPrefix(vArgv, "--metadata-from-file=startup-script=");
  ASSERT_FALSE(sScript.empty());
  EXPECT_FALSE(std::filesystem::exists(sScript));
}

TEST_F(GcloudClientTest, ParseInstanceReducesUrls) {
  auto ii = GcloudClient::parseInstance(nlohmann::json::parse(kInstanceJson));
  EXPECT_EQ(ii.sName, "p-router-vm");
  EXPECT_EQ(ii.sZone, "us-central1-a");
  EXPECT_EQ(ii.sMachineType, "e2-micro");
  EXPECT_EQ(ii.sExternalIp, "203.0.113.10");
}

TEST_F(GcloudClientTest, ListDisksParsesStringSizes) {
  GcloudClient gcc(_fpr, "p");
  _fpr.enqueue(0, R"([{"name": "d1", "zone": "zones/us-east1-b",
                      "type": "projects/p/zones/us-east1-b/diskTypes/pd-standard",
                      "sizeGb": "10"},
                     {"name": "d2", "zone": "zones/us-east1-b", "type": "pd-standard",
                      "sizeGb": 20}])");
  auto vDisks = gcc.listDisks("pd-standard");
  ASSERT_EQ(vDisks.size(), 2u);
  EXPECT_EQ(vDisks[0].iSizeGb, 10);
  EXPECT_EQ(vDisks[0].sType, "pd-standard");
  EXPECT_EQ(vDisks[1].iSizeGb, 20);
}

TEST_F(GcloudClientTest, InventoryFailureThrows) {
  GcloudClient gcc(_fpr, "p");
  _fpr.enqueue(1, "", "ERROR: permission denied");
  EXPECT_THROW(gcc.listInstances("e2-micro"), CloudCommandError);

  _fpr.enqueue(0, "not json");
  EXPECT_THROW(gcc.listStaticAddresses(), CloudCommandError);
}

TEST_F(GcloudClientTest, UnsetProjectIsEmpty) {
  GcloudClient gcc(_fpr, "");
  _fpr.enqueue(0, "(unset)\n");
  EXPECT_TRUE(gcc.activeProject().empty());
  _fpr.enqueue(0, "my-project\n");
  EXPECT_EQ(gcc.activeProject(), "my-project");
}

TEST_F(GcloudClientTest, BillingAccountStripsCollectionPrefix) {
  GcloudClient gcc(_fpr, "p");
  _fpr.enqueue(0, "billingAccounts/000000-AAAAAA-111111\n");
  EXPECT_EQ(gcc.billingAccount().value_or(""), "000000-AAAAAA-111111");
  _fpr.enqueue(0, "\n");
  EXPECT_FALSE(gcc.billingAccount().has_value());
}

TEST_F(GcloudClientTest, BudgetCarriesThresholdRules) {
  GcloudClient gcc(_fpr, "p");
  cdp::core::ResourceCatalog rc(_cfg);
  _fpr.enqueue(0, "billingAccounts/000000-AAAAAA-111111\n");
  _fpr.enqueue(0);
  auto cr = gcc.create(rc.budget());
  ASSERT_TRUE(cr.bSuccess);
  const auto& vArgv = _fpr.vInvocations.back();
  EXPECT_TRUE(contains(vArgv, "--billing-account=000000-AAAAAA-111111"));
  EXPECT_TRUE(contains(vArgv, "--budget-amount=1USD"));
  EXPECT_TRUE(contains(vArgv, "--threshold-rule=percent=0.5"));
  EXPECT_TRUE(contains(vArgv, "--threshold-rule=percent=0.9"));
}

TEST_F(GcloudClientTest, SecretPayloadTravelsOnStdin) {
  GcloudClient gcc(_fpr, "p");
  EXPECT_TRUE(gcc.secrets().addVersion("p-router-api-key", "s3cr3t"));
  EXPECT_EQ(_fpr.vStdin.back(), "s3cr3t");
  for (const auto& sArg : _fpr.vInvocations.back()) {
    EXPECT_EQ(sArg.find("s3cr3t"), std::string::npos);
  }
  EXPECT_TRUE(_fpr.lastHas("--data-file=-"));
}

TEST_F(GcloudClientTest, RemoteCommandGoesThroughSsh) {
  GcloudClient gcc(_fpr, "p");
  gcc.runRemote("p-router-vm", "us-central1-a", "uptime");
  const auto& vArgv = _fpr.vInvocations.back();
  EXPECT_TRUE(contains(vArgv, "ssh"));
  EXPECT_TRUE(contains(vArgv, "--command=uptime"));
}
