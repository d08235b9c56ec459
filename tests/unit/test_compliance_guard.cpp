#include "core/ComplianceGuard.hpp"
#include "core/ResourceCatalog.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "fakes/FakeCloudClient.hpp"

using namespace cdp::core;
using cdp::common::Config;
using cdp::common::DiskInfo;
using cdp::common::InstanceInfo;

namespace {

Config makeConfig() {
  Config cfg;
  cfg.sProjectId = "demo-project";
  return cfg;
}

const RuleResult& find(const std::vector<RuleResult>& vResults, const std::string& sRule) {
  for (const auto& rr : vResults) {
    if (rr.sRule == sRule) return rr;
  }
  throw std::out_of_range("no rule " + sRule);
}

int failedCount(const std::vector<RuleResult>& vResults, Severity severity) {
  int n = 0;
  for (const auto& rr : vResults) {
    if (!rr.bPassed && rr.severity == severity) ++n;
  }
  return n;
}

}  // namespace

class ComplianceGuardTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _cfg = makeConfig();
    _lcs.oBillingAccount = "billingAccounts/000000-AAAAAA-111111";
    _lcs.sOwnInstanceName = "demo-project-router-vm";
    _lcs.sOwnDiskName = "demo-project-router-disk";
  }

  Config _cfg;
  LiveCloudState _lcs;
  ComplianceGuard _cg;
};

TEST_F(ComplianceGuardTest, DefaultConfigPasses) {
  auto vResults = _cg.evaluate(_cfg, _lcs);
  EXPECT_EQ(vResults.size(), _cg.ruleCount());
  EXPECT_FALSE(ComplianceGuard::hasHardFailure(vResults));
  for (const auto& rr : vResults) {
    EXPECT_TRUE(rr.bPassed) << rr.sRule << ": " << rr.sMessage;
  }
}

TEST_F(ComplianceGuardTest, NonFreeRegionIsTheOnlyHardFailure) {
  _cfg.sRegion = "europe-west1";
  _cfg.sZone = "europe-west1-b";
  auto vResults = _cg.evaluate(_cfg, _lcs);
  EXPECT_TRUE(ComplianceGuard::hasHardFailure(vResults));
  EXPECT_EQ(failedCount(vResults, Severity::Hard), 1);
  EXPECT_FALSE(find(vResults, "region-allowed").bPassed);
  EXPECT_NE(find(vResults, "region-allowed").sMessage.find("europe-west1"), std::string::npos);
}

TEST_F(ComplianceGuardTest, ZoneMustBelongToRegion) {
  _cfg.sZone = "us-east1-b";
  auto vResults = _cg.evaluate(_cfg, _lcs);
  EXPECT_FALSE(find(vResults, "zone-in-region").bPassed);
  EXPECT_TRUE(find(vResults, "region-allowed").bPassed);
}

TEST_F(ComplianceGuardTest, ThirtyGigabytesIsInclusive) {
  _cfg.iDiskSizeGb = 30;
  EXPECT_FALSE(ComplianceGuard::hasHardFailure(_cg.evaluate(_cfg, _lcs)));

  _cfg.iDiskSizeGb = 31;
  auto vResults = _cg.evaluate(_cfg, _lcs);
  EXPECT_FALSE(find(vResults, "disk-size").bPassed);
  EXPECT_FALSE(find(vResults, "standard-storage-quota").bPassed);
}

TEST_F(ComplianceGuardTest, ExistingDisksCountTowardsStorageCeiling) {
  _cfg.iDiskSizeGb = 20;
  _lcs.vStandardDisks.push_back(DiskInfo{"legacy-disk", "us-central1-a", "pd-standard", 10});
  EXPECT_TRUE(find(_cg.evaluate(_cfg, _lcs), "standard-storage-quota").bPassed);

  _lcs.vStandardDisks.push_back(DiskInfo{"other-disk", "us-central1-b", "pd-standard", 1});
  auto rr = find(_cg.evaluate(_cfg, _lcs), "standard-storage-quota");
  EXPECT_FALSE(rr.bPassed);
  EXPECT_EQ(rr.severity, Severity::Hard);
  EXPECT_NE(rr.sMessage.find("31 GB"), std::string::npos);
}

TEST_F(ComplianceGuardTest, OwnResourcesExcludedOnRerun) {
  _lcs.vMinimalTierInstances.push_back(
      InstanceInfo{"demo-project-router-vm", "us-central1-a", "e2-micro", "RUNNING", "", ""});
  _lcs.vStandardDisks.push_back(
      DiskInfo{"demo-project-router-disk", "us-central1-a", "pd-standard", 30});
  EXPECT_FALSE(ComplianceGuard::hasHardFailure(_cg.evaluate(_cfg, _lcs)));
}

TEST_F(ComplianceGuardTest, ForeignMinimalInstanceFails) {
  _lcs.vMinimalTierInstances.push_back(
      InstanceInfo{"someone-else", "us-west1-b", "e2-micro", "RUNNING", "", ""});
  auto rr = find(_cg.evaluate(_cfg, _lcs), "minimal-instance-quota");
  EXPECT_FALSE(rr.bPassed);
  EXPECT_NE(rr.sMessage.find("someone-else"), std::string::npos);
}

TEST_F(ComplianceGuardTest, ForceDowngradesOnlyOverridableRules) {
  _cfg.sMachineType = "e2-small";
  _cfg.bForce = true;
  auto vResults = _cg.evaluate(_cfg, _lcs);
  const auto& rrMachine = find(vResults, "machine-type");
  EXPECT_FALSE(rrMachine.bPassed);
  EXPECT_EQ(rrMachine.severity, Severity::Warn);
  EXPECT_NE(rrMachine.sMessage.find("overridden by --force"), std::string::npos);
  EXPECT_FALSE(ComplianceGuard::hasHardFailure(vResults));

  _cfg.sRegion = "asia-east1";
  _cfg.sZone = "asia-east1-a";
  EXPECT_TRUE(ComplianceGuard::hasHardFailure(_cg.evaluate(_cfg, _lcs)));
}

TEST_F(ComplianceGuardTest, InformationalRulesOnlyWarn) {
  _lcs.vStaticAddresses = {"reserved-ip"};
  _lcs.oBillingAccount.reset();
  auto vResults = _cg.evaluate(_cfg, _lcs);
  EXPECT_FALSE(ComplianceGuard::hasHardFailure(vResults));
  EXPECT_EQ(failedCount(vResults, Severity::Warn), 2);
}

TEST_F(ComplianceGuardTest, CustomRuleParticipates) {
  const size_t nBefore = _cg.ruleCount();
  _cg.addRule({"app-name-set", Severity::Hard, false,
               [](const Config& cfg, const LiveCloudState&) -> std::optional<std::string> {
                 if (cfg.sAppName == "router") return std::nullopt;
                 return std::string("unexpected app");
               }});
  EXPECT_EQ(_cg.ruleCount(), nBefore + 1);
  _cfg.sAppName = "other";
  EXPECT_TRUE(ComplianceGuard::hasHardFailure(_cg.evaluate(_cfg, _lcs)));
}

TEST(ComplianceSnapshotTest, ReadsInventoryFromClient) {
  auto cfg = makeConfig();
  ResourceCatalog rc(cfg);
  cdp::test::FakeCloudClient fcc;
  fcc.vForeignInstances.push_back(
      InstanceInfo{"elsewhere", "us-east1-b", "e2-micro", "RUNNING", "", ""});
  fcc.vForeignInstances.push_back(
      InstanceInfo{"big", "us-east1-b", "n2-standard-4", "RUNNING", "", ""});
  fcc.vStaticAddresses = {"addr-1"};
  fcc.oBillingAccount.reset();

  auto lcs = ComplianceGuard::snapshot(fcc, cfg, rc);
  ASSERT_EQ(lcs.vMinimalTierInstances.size(), 1u);
  EXPECT_EQ(lcs.vMinimalTierInstances[0].sName, "elsewhere");
  EXPECT_EQ(lcs.vStaticAddresses.size(), 1u);
  EXPECT_FALSE(lcs.oBillingAccount.has_value());
  EXPECT_EQ(lcs.sOwnInstanceName, rc.instance().sName);
  EXPECT_EQ(lcs.sOwnDiskName, rc.disk().sName);
}
