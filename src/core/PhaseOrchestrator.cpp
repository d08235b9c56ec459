#include "core/PhaseOrchestrator.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

namespace cdp::core {

std::string stateName(OrchestratorState state) {
  switch (state) {
    case OrchestratorState::Idle:       return "Idle";
    case OrchestratorState::Validating: return "Validating";
    case OrchestratorState::Running:    return "Running";
    case OrchestratorState::Completed:  return "Completed";
    case OrchestratorState::Aborted:    return "Aborted";
  }
  return "Unknown";
}

PhaseOrchestrator::PhaseOrchestrator(const common::Config& cfg, cloud::ICloudClient& icClient,
                                     dal::StateStore& ssStore,
                                     std::vector<std::unique_ptr<IPhase>> vPhases,
                                     SleepFn fnSleep)
    : _cfg(cfg),
      _icClient(icClient),
      _ssStore(ssStore),
      _vPhases(std::move(vPhases)),
      _fnSleep(std::move(fnSleep)),
      _rcCatalog(cfg),
      _rcnReconciler(icClient) {
  if (!_fnSleep) {
    _fnSleep = [](std::chrono::seconds secDelay) { std::this_thread::sleep_for(secDelay); };
  }
  std::sort(_vPhases.begin(), _vPhases.end(),
            [](const auto& upA, const auto& upB) { return upA->ordinal() < upB->ordinal(); });
}

PhaseOrchestrator::~PhaseOrchestrator() = default;

std::vector<int> PhaseOrchestrator::resolvePhases(const std::vector<int>& vRequested,
                                                  int iPhaseCount) {
  std::vector<int> vOut;
  if (vRequested.empty()) {
    for (int i = 1; i <= iPhaseCount; ++i) vOut.push_back(i);
    return vOut;
  }
  for (int iOrdinal : vRequested) {
    if (iOrdinal < 1 || iOrdinal > iPhaseCount) {
      throw common::ConfigError("invalid_phase", "Phase " + std::to_string(iOrdinal) +
                                                     " does not exist (valid: 1-" +
                                                     std::to_string(iPhaseCount) + ")");
    }
    vOut.push_back(iOrdinal);
  }
  std::sort(vOut.begin(), vOut.end());
  vOut.erase(std::unique(vOut.begin(), vOut.end()), vOut.end());
  return vOut;
}

IPhase& PhaseOrchestrator::phase(int iOrdinal) {
  for (auto& upPhase : _vPhases) {
    if (upPhase->ordinal() == iOrdinal) return *upPhase;
  }
  throw common::ConfigError("invalid_phase", "No phase with ordinal " + std::to_string(iOrdinal));
}

void PhaseOrchestrator::transition(RunResult& rrResult, OrchestratorState state, int iPhase,
                                   const std::string& sDetail) {
  auto spLog = common::Logger::get();
  if (state == OrchestratorState::Running) {
    spLog->info("State: {} -> Running(phase {}: {})", stateName(_state), iPhase, sDetail);
  } else if (state == OrchestratorState::Aborted) {
    spLog->error("State: {} -> Aborted: {}", stateName(_state), sDetail);
  } else {
    spLog->info("State: {} -> {}", stateName(_state), stateName(state));
  }
  _state = state;
  rrResult.vTransitions.push_back({state, iPhase, sDetail});
}

// ── Validation ─────────────────────────────────────────────────────────────

void PhaseOrchestrator::checkPrerequisites() {
  auto spLog = common::Logger::get();
  if (!_icClient.isInstalled()) {
    throw common::PrerequisiteError("cli_missing",
                                    _icClient.name() + " CLI is not installed or not on PATH");
  }
  const std::string sAccount = _icClient.activeAccount();
  if (sAccount.empty()) {
    throw common::PrerequisiteError("not_authenticated",
                                    "No active account; run 'gcloud auth login'");
  }
  spLog->info("Authenticated as {}", sAccount);
  if (_cfg.sProjectId.empty()) {
    throw common::PrerequisiteError("no_project", "No project selected");
  }
  spLog->info("Target project {}, region {}, zone {}", _cfg.sProjectId, _cfg.sRegion,
              _cfg.sZone);
}

void PhaseOrchestrator::runCompliance(RunResult& rrResult) {
  const auto lcsState = ComplianceGuard::snapshot(_icClient, _cfg, _rcCatalog);
  rrResult.vCompliance = _cgGuard.evaluate(_cfg, lcsState);
  ComplianceGuard::logResults(rrResult.vCompliance);

  for (const auto& rr : rrResult.vCompliance) {
    if (!rr.bPassed && rr.severity == Severity::Warn) {
      rrResult.vWarnings.push_back({"compliance:" + rr.sRule, rr.sMessage});
    }
  }
  if (ComplianceGuard::hasHardFailure(rrResult.vCompliance)) {
    std::string sFailed;
    for (const auto& rr : rrResult.vCompliance) {
      if (rr.bPassed || rr.severity != Severity::Hard) continue;
      if (!sFailed.empty()) sFailed += "; ";
      sFailed += rr.sMessage;
    }
    throw common::ComplianceError("compliance_failed", "Compliance check failed: " + sFailed);
  }
}

// ── Execution ──────────────────────────────────────────────────────────────

void PhaseOrchestrator::runPhases(RunResult& rrResult, const std::vector<int>& vOrdinals) {
  dal::DeploymentState dsState = _ssStore.load();
  PhaseContext pcContext(_cfg, _icClient, _rcnReconciler, _rcCatalog, dsState,
                         rrResult.vWarnings, _fnSleep);

  for (int iOrdinal : vOrdinals) {
    IPhase& ipPhase = phase(iOrdinal);
    transition(rrResult, OrchestratorState::Running, iOrdinal, ipPhase.label());

    for (auto field : ipPhase.requiredFields()) {
      dsState.require(field);
    }

    ipPhase.execute(pcContext);

    for (auto field : ipPhase.producedFields()) {
      if (!dsState.has(field)) {
        throw common::ReconciliationError(
            "phase_incomplete", "Phase " + std::to_string(iOrdinal) + " (" + ipPhase.label() +
                                    ") finished without producing its " + dal::fieldLabel(field));
      }
      _ssStore.write(iOrdinal, field, dsState);
    }
    rrResult.vCompletedPhases.push_back(iOrdinal);
    common::Logger::get()->info("Phase {} ({}) completed", iOrdinal, ipPhase.label());
  }

  reportAccessUrl(rrResult, dsState);
}

void PhaseOrchestrator::reportAccessUrl(RunResult& rrResult,
                                        const dal::DeploymentState& dsState) {
  if (!dsState.oInstance) {
    return;
  }
  const auto& iid = *dsState.oInstance;
  std::string sProblem;
  try {
    auto oInfo = _icClient.describeInstance(iid.sName, iid.sZone);
    if (oInfo && !oInfo->sExternalIp.empty()) {
      rrResult.oAccessUrl = "https://" + oInfo->sExternalIp;
      common::Logger::get()->info("Service reachable at {}", *rrResult.oAccessUrl);
      return;
    }
    sProblem = "instance " + iid.sName + " has no external address";
  } catch (const common::AppError& ex) {
    sProblem = ex.what();
  } catch (const std::exception& ex) {
    sProblem = ex.what();
  }
  common::Logger::get()->info("Could not determine the access URL: {}", sProblem);
  rrResult.vWarnings.push_back({"access-url", sProblem});
}

RunResult PhaseOrchestrator::run(const RunRequest& rqRequest) {
  RunResult rrResult;
  _state = OrchestratorState::Idle;
  rrResult.vTransitions.push_back({OrchestratorState::Idle, 0, {}});

  try {
    const auto vOrdinals =
        rqRequest.mode == RunMode::Deploy
            ? resolvePhases(rqRequest.vPhases, static_cast<int>(_vPhases.size()))
            : std::vector<int>{};

    transition(rrResult, OrchestratorState::Validating);
    checkPrerequisites();

    const bool bMutates = std::any_of(vOrdinals.begin(), vOrdinals.end(),
                                      [this](int i) { return phase(i).mutatesCloud(); });
    if (rqRequest.mode == RunMode::ValidateOnly ||
        (rqRequest.mode == RunMode::Deploy && bMutates)) {
      runCompliance(rrResult);
    }

    switch (rqRequest.mode) {
      case RunMode::ValidateOnly:
        common::Logger::get()->info("Validation passed; no resources were touched");
        break;
      case RunMode::Cleanup: {
        CleanupEngine ceEngine(_cfg, _icClient, _rcCatalog, _ssStore);
        rrResult.oCleanup = ceEngine.cleanup(rqRequest.cleanupMode);
        for (const auto& bew : rrResult.oCleanup->vWarnings) rrResult.vWarnings.push_back(bew);
        break;
      }
      case RunMode::Deploy:
        runPhases(rrResult, vOrdinals);
        break;
    }
    transition(rrResult, OrchestratorState::Completed);
  } catch (const common::AppError& ex) {
    rrResult.iExitCode = ex._iExitCode;
    rrResult.sErrorCode = ex._sErrorCode;
    rrResult.sAbortReason = ex.what();
    transition(rrResult, OrchestratorState::Aborted, 0, rrResult.sAbortReason);
  } catch (const std::system_error& ex) {
    rrResult.iExitCode = 1;
    rrResult.sErrorCode = "system_error";
    rrResult.sAbortReason = ex.what();
    transition(rrResult, OrchestratorState::Aborted, 0, rrResult.sAbortReason);
  } catch (const std::exception& ex) {
    rrResult.iExitCode = 1;
    rrResult.sErrorCode = "internal_error";
    rrResult.sAbortReason = std::string("Internal error: ") + ex.what();
    transition(rrResult, OrchestratorState::Aborted, 0, rrResult.sAbortReason);
  }

  if (!rrResult.vWarnings.empty()) {
    common::Logger::get()->warn("{} warning(s) during this run", rrResult.vWarnings.size());
  }
  return rrResult;
}

}  // namespace cdp::core
