#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "cloud/ICloudClient.hpp"
#include "common/Config.hpp"
#include "common/Types.hpp"
#include "core/Reconciler.hpp"
#include "core/ResourceCatalog.hpp"
#include "dal/DeploymentState.hpp"

namespace cdp::core {

using SleepFn = std::function<void(std::chrono::seconds)>;

/// Everything a phase body may touch. Built by the orchestrator for each run.
/// Class abbreviation: pc
class PhaseContext {
 public:
  PhaseContext(const common::Config& cfg, cloud::ICloudClient& icClient,
               Reconciler& rcnReconciler, const ResourceCatalog& rcCatalog,
               dal::DeploymentState& dsState, std::vector<common::BestEffortWarning>& vWarnings,
               SleepFn fnSleep);
  ~PhaseContext();

  const common::Config& config() const { return _cfg; }
  cloud::ICloudClient& client() { return _icClient; }
  Reconciler& reconciler() { return _rcnReconciler; }
  const ResourceCatalog& catalog() const { return _rcCatalog; }
  dal::DeploymentState& state() { return _dsState; }

  /// Reconcile one descriptor. A failed optional descriptor becomes a
  /// warning; any other failure throws ReconciliationError.
  common::ReconcileOutcome ensure(const common::ResourceDescriptor& rdResource);

  /// Run sCommand on the deployment's VM. Throws ReconciliationError on a
  /// non-zero exit, MissingStateError if no instance identity is recorded.
  common::CommandResult runRemote(const std::string& sStep, const std::string& sCommand);

  /// Same as runRemote but returns the result instead of throwing.
  common::CommandResult tryRemote(const std::string& sCommand);

  void warn(const std::string& sSource, const std::string& sMessage);
  void sleep(std::chrono::seconds secDelay);

 private:
  const common::Config& _cfg;
  cloud::ICloudClient& _icClient;
  Reconciler& _rcnReconciler;
  const ResourceCatalog& _rcCatalog;
  dal::DeploymentState& _dsState;
  std::vector<common::BestEffortWarning>& _vWarnings;
  SleepFn _fnSleep;
};

}  // namespace cdp::core
