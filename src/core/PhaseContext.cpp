#include "core/PhaseContext.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/ResourceNaming.hpp"

#include <utility>

namespace cdp::core {

namespace {
std::string lastLine(const std::string& sText) {
  std::string sTrimmed = sText;
  while (!sTrimmed.empty() && (sTrimmed.back() == '\n' || sTrimmed.back() == '\r')) {
    sTrimmed.pop_back();
  }
  const auto iNl = sTrimmed.find_last_of('\n');
  return iNl == std::string::npos ? sTrimmed : sTrimmed.substr(iNl + 1);
}
}  // namespace

PhaseContext::PhaseContext(const common::Config& cfg, cloud::ICloudClient& icClient,
                           Reconciler& rcnReconciler, const ResourceCatalog& rcCatalog,
                           dal::DeploymentState& dsState,
                           std::vector<common::BestEffortWarning>& vWarnings, SleepFn fnSleep)
    : _cfg(cfg),
      _icClient(icClient),
      _rcnReconciler(rcnReconciler),
      _rcCatalog(rcCatalog),
      _dsState(dsState),
      _vWarnings(vWarnings),
      _fnSleep(std::move(fnSleep)) {}

PhaseContext::~PhaseContext() = default;

common::ReconcileOutcome PhaseContext::ensure(const common::ResourceDescriptor& rdResource) {
  auto ro = _rcnReconciler.reconcile(rdResource);
  if (ro.status != common::ReconcileStatus::Failed) {
    return ro;
  }
  const std::string sWhat = kindLabel(rdResource.kind) + " " + rdResource.sName;
  if (rdResource.bOptional) {
    warn(sWhat, ro.sReason);
    return ro;
  }
  throw common::ReconciliationError("create_failed",
                                    "Failed to create " + sWhat + ": " + ro.sReason);
}

common::CommandResult PhaseContext::runRemote(const std::string& sStep,
                                              const std::string& sCommand) {
  common::Logger::get()->info("Remote step: {}", sStep);
  auto cmr = tryRemote(sCommand);
  if (!cmr.ok()) {
    std::string sDetail = lastLine(cmr.sStderr);
    if (sDetail.empty()) sDetail = lastLine(cmr.sStdout);
    throw common::ReconciliationError(
        "remote_step_failed",
        "Remote step '" + sStep + "' failed (exit " + std::to_string(cmr.iExitCode) + ")" +
            (sDetail.empty() ? std::string{} : ": " + sDetail));
  }
  return cmr;
}

common::CommandResult PhaseContext::tryRemote(const std::string& sCommand) {
  const auto& iid = _dsState.instance();
  return _icClient.runRemote(iid.sName, iid.sZone, sCommand);
}

void PhaseContext::warn(const std::string& sSource, const std::string& sMessage) {
  common::Logger::get()->warn("{}: {}", sSource, sMessage);
  _vWarnings.push_back({sSource, sMessage});
}

void PhaseContext::sleep(std::chrono::seconds secDelay) {
  if (_fnSleep) _fnSleep(secDelay);
}

}  // namespace cdp::core
