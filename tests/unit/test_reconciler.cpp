#include "core/Reconciler.hpp"

#include <gtest/gtest.h>

#include "core/ResourceCatalog.hpp"
#include "fakes/FakeCloudClient.hpp"

using namespace cdp::core;
using cdp::common::Config;
using cdp::common::ReconcileStatus;
using cdp::common::ResourceKind;

class ReconcilerTest : public ::testing::Test {
 protected:
  void SetUp() override { _cfg.sProjectId = "demo-project"; }

  Config _cfg;
  cdp::test::FakeCloudClient _fcc;
};

TEST_F(ReconcilerTest, CreatesWhenAbsent) {
  ResourceCatalog rc(_cfg);
  Reconciler rcn(_fcc);
  auto ro = rcn.reconcile(rc.network());
  EXPECT_EQ(ro.status, ReconcileStatus::Created);
  EXPECT_EQ(ro.sName, "demo-project-router-vpc");
  EXPECT_EQ(_fcc.createCount(ResourceKind::Network, ro.sName), 1);
}

TEST_F(ReconcilerTest, SecondReconcileIsNoOp) {
  ResourceCatalog rc(_cfg);
  Reconciler rcn(_fcc);
  rcn.reconcile(rc.disk());
  auto ro = rcn.reconcile(rc.disk());
  EXPECT_EQ(ro.status, ReconcileStatus::AlreadyExists);
  EXPECT_EQ(_fcc.createCount(ResourceKind::Disk, rc.disk().sName), 1);
}

TEST_F(ReconcilerTest, InstanceCreationReturnsAddresses) {
  ResourceCatalog rc(_cfg);
  Reconciler rcn(_fcc);
  auto ro = rcn.reconcile(rc.instance());
  ASSERT_EQ(ro.status, ReconcileStatus::Created);
  EXPECT_EQ(ro.mAttributes["externalIp"], "203.0.113.10");
}

TEST_F(ReconcilerTest, CreateFailureIsReportedNotThrown) {
  ResourceCatalog rc(_cfg);
  Reconciler rcn(_fcc);
  _fcc.setFailCreate.insert(rc.subnet().sName);
  auto ro = rcn.reconcile(rc.subnet());
  EXPECT_EQ(ro.status, ReconcileStatus::Failed);
  EXPECT_NE(ro.sReason.find("quota exceeded"), std::string::npos);
}

TEST_F(ReconcilerTest, ExistenceErrorBecomesFailedOutcome) {
  ResourceCatalog rc(_cfg);
  Reconciler rcn(_fcc);
  _fcc.setExistsThrows.insert(rc.network().sName);
  auto ro = rcn.reconcile(rc.network());
  EXPECT_EQ(ro.status, ReconcileStatus::Failed);
  EXPECT_NE(ro.sReason.find("timed out"), std::string::npos);
  EXPECT_EQ(_fcc.callCount("create:"), 0u);
}

TEST_F(ReconcilerTest, ReconcileAllStopsAtFirstRequiredFailure) {
  ResourceCatalog rc(_cfg);
  Reconciler rcn(_fcc);
  auto vResources = rc.infrastructure();
  _fcc.setFailCreate.insert(rc.subnet().sName);

  auto vOutcomes = rcn.reconcileAll(vResources);
  ASSERT_EQ(vOutcomes.size(), 2u);
  EXPECT_EQ(vOutcomes[0].status, ReconcileStatus::Created);
  EXPECT_EQ(vOutcomes[1].status, ReconcileStatus::Failed);
  EXPECT_EQ(_fcc.callCount("create:"), 2u);
}

TEST_F(ReconcilerTest, ReconcileAllContinuesPastOptionalFailure) {
  ResourceCatalog rc(_cfg);
  Reconciler rcn(_fcc);
  auto vResources = rc.monitoring("203.0.113.10");
  _fcc.setFailCreate.insert(vResources.front().sName);

  auto vOutcomes = rcn.reconcileAll(vResources);
  ASSERT_EQ(vOutcomes.size(), vResources.size());
  EXPECT_EQ(vOutcomes.front().status, ReconcileStatus::Failed);
  EXPECT_EQ(vOutcomes.back().status, ReconcileStatus::Created);
}

TEST_F(ReconcilerTest, RerunAfterFailureCreatesOnlyMissing) {
  ResourceCatalog rc(_cfg);
  Reconciler rcn(_fcc);
  auto vResources = rc.infrastructure();
  _fcc.mFailCreateTimes[rc.disk().sName] = 1;
  rcn.reconcileAll(vResources);

  auto vOutcomes = rcn.reconcileAll(vResources);
  ASSERT_EQ(vOutcomes.size(), vResources.size());
  for (const auto& ro : vOutcomes) {
    if (ro.kind == ResourceKind::Disk || ro.kind == ResourceKind::Instance) {
      EXPECT_EQ(ro.status, ReconcileStatus::Created) << ro.sName;
    } else {
      EXPECT_EQ(ro.status, ReconcileStatus::AlreadyExists) << ro.sName;
    }
  }
  EXPECT_EQ(_fcc.createCount(ResourceKind::Network, rc.network().sName), 1);
}
