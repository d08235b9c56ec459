#include "core/phases/InfrastructurePhase.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/RemoteScripts.hpp"

namespace cdp::core {

using common::ResourceKind;
using common::ReconcileStatus;

const std::vector<std::string>& InfrastructurePhase::serviceAccountRoles() {
  static const std::vector<std::string> vRoles = {
      "roles/logging.logWriter",
      "roles/monitoring.metricWriter",
      "roles/secretmanager.secretAccessor",
  };
  return vRoles;
}

void InfrastructurePhase::execute(PhaseContext& pcContext) {
  const auto vResources = pcContext.catalog().infrastructure();
  for (const auto& rd : vResources) {
    auto ro = pcContext.ensure(rd);
    if (rd.kind == ResourceKind::ServiceAccount) {
      grantRoles(pcContext);
    } else if (rd.kind == ResourceKind::Instance) {
      if (ro.status == ReconcileStatus::AlreadyExists) {
        startIfStopped(pcContext, rd);
      }
      recordIdentity(pcContext, rd);
    }
  }
  waitForStartup(pcContext);
}

void InfrastructurePhase::grantRoles(PhaseContext& pcContext) {
  const std::string sMember = pcContext.catalog().serviceAccountMember();
  for (const auto& sRole : serviceAccountRoles()) {
    if (!pcContext.client().grantProjectRole(sMember, sRole)) {
      pcContext.warn("iam", "Could not grant " + sRole + " to " + sMember);
    }
  }
}

void InfrastructurePhase::startIfStopped(PhaseContext& pcContext,
                                         const common::ResourceDescriptor& rdInstance) {
  auto oInfo = pcContext.client().describeInstance(rdInstance.sName, rdInstance.sLocation);
  if (!oInfo || oInfo->sStatus == "RUNNING") return;

  common::Logger::get()->info("Instance {} is {}; starting it", rdInstance.sName, oInfo->sStatus);
  if (!pcContext.client().startInstance(rdInstance.sName, rdInstance.sLocation)) {
    throw common::ReconciliationError("instance_start_failed",
                                      "Could not start instance " + rdInstance.sName);
  }
}

void InfrastructurePhase::recordIdentity(PhaseContext& pcContext,
                                         const common::ResourceDescriptor& rdInstance) {
  auto oInfo = pcContext.client().describeInstance(rdInstance.sName, rdInstance.sLocation);
  if (!oInfo) {
    throw common::ReconciliationError("instance_missing",
                                      "Instance " + rdInstance.sName +
                                          " could not be described after reconciliation");
  }

  dal::InstanceIdentity iid;
  iid.sName = rdInstance.sName;
  iid.sZone = rdInstance.sLocation;
  iid.sInternalIp = oInfo->sInternalIp;
  iid.sExternalIp = oInfo->sExternalIp;
  if (iid.sExternalIp.empty()) {
    pcContext.warn("instance", "Instance " + iid.sName + " has no external address yet");
  }

  auto spLog = common::Logger::get();
  spLog->info("Instance {} in {}: internal {}, external {}", iid.sName, iid.sZone,
              iid.sInternalIp, iid.sExternalIp.empty() ? "-" : iid.sExternalIp);
  spLog->warn("The external address is ephemeral and may change if the instance is stopped");
  pcContext.state().oInstance = iid;
}

void InfrastructurePhase::waitForStartup(PhaseContext& pcContext) {
  const auto& cfg = pcContext.config();
  auto spLog = common::Logger::get();

  for (int iAttempt = 1; iAttempt <= cfg.iReadyPollAttempts; ++iAttempt) {
    if (pcContext.tryRemote(remote::startupCompleteCheck()).ok()) {
      spLog->info("Instance startup script finished");
      return;
    }
    spLog->info("Attempt {}/{}: waiting for the startup script", iAttempt,
                cfg.iReadyPollAttempts);
    if (iAttempt < cfg.iReadyPollAttempts) {
      pcContext.sleep(std::chrono::seconds(cfg.iReadyPollIntervalSeconds));
    }
  }
  pcContext.warn("startup", "Instance may not be fully provisioned yet; continuing");
}

}  // namespace cdp::core
