#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cloud/ICloudClient.hpp"
#include "common/Config.hpp"
#include "common/Types.hpp"
#include "core/CleanupEngine.hpp"
#include "core/ComplianceGuard.hpp"
#include "core/IPhase.hpp"
#include "core/PhaseContext.hpp"
#include "core/Reconciler.hpp"
#include "core/ResourceCatalog.hpp"
#include "dal/StateStore.hpp"

namespace cdp::core {

enum class RunMode { Deploy, Cleanup, ValidateOnly };

enum class OrchestratorState { Idle, Validating, Running, Completed, Aborted };

std::string stateName(OrchestratorState state);

/// One recorded state-machine step. iPhase is set for Running.
struct StateTransition {
  OrchestratorState state = OrchestratorState::Idle;
  int iPhase = 0;
  std::string sDetail;
};

/// Class abbreviation: rq
struct RunRequest {
  RunMode mode = RunMode::Deploy;
  std::vector<int> vPhases;  // empty: every phase
  CleanupMode cleanupMode = CleanupMode::Execute;
};

/// Class abbreviation: rr
struct RunResult {
  int iExitCode = 0;
  std::string sErrorCode;
  std::string sAbortReason;
  std::vector<int> vCompletedPhases;
  std::optional<std::string> oAccessUrl;
  std::vector<RuleResult> vCompliance;
  std::optional<CleanupReport> oCleanup;
  std::vector<common::BestEffortWarning> vWarnings;
  std::vector<StateTransition> vTransitions;

  bool ok() const { return iExitCode == 0; }
};

/// Top-level driver: prerequisites, compliance gate, ordered phases, final
/// report. Fail-fast; a failed run is resumed by running it again.
/// Class abbreviation: po
class PhaseOrchestrator {
 public:
  PhaseOrchestrator(const common::Config& cfg, cloud::ICloudClient& icClient,
                    dal::StateStore& ssStore, std::vector<std::unique_ptr<IPhase>> vPhases,
                    SleepFn fnSleep = {});
  ~PhaseOrchestrator();

  PhaseOrchestrator(const PhaseOrchestrator&) = delete;
  PhaseOrchestrator& operator=(const PhaseOrchestrator&) = delete;

  /// Never throws an AppError: failures end in Aborted with the error's exit
  /// code and message in the result.
  RunResult run(const RunRequest& rqRequest);

  OrchestratorState state() const { return _state; }

  /// Sort and de-duplicate requested ordinals. Empty selects every phase.
  /// Throws ConfigError on an ordinal outside 1..iPhaseCount.
  static std::vector<int> resolvePhases(const std::vector<int>& vRequested, int iPhaseCount);

 private:
  void transition(RunResult& rrResult, OrchestratorState state, int iPhase = 0,
                  const std::string& sDetail = {});
  void checkPrerequisites();
  void runCompliance(RunResult& rrResult);
  void runPhases(RunResult& rrResult, const std::vector<int>& vOrdinals);
  void reportAccessUrl(RunResult& rrResult, const dal::DeploymentState& dsState);
  IPhase& phase(int iOrdinal);

  const common::Config& _cfg;
  cloud::ICloudClient& _icClient;
  dal::StateStore& _ssStore;
  std::vector<std::unique_ptr<IPhase>> _vPhases;
  SleepFn _fnSleep;

  ResourceCatalog _rcCatalog;
  Reconciler _rcnReconciler;
  ComplianceGuard _cgGuard;
  OrchestratorState _state = OrchestratorState::Idle;
};

}  // namespace cdp::core
