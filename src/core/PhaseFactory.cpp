#include "core/PhaseFactory.hpp"

#include "core/phases/ApplicationPhase.hpp"
#include "core/phases/HealthcheckPhase.hpp"
#include "core/phases/InfrastructurePhase.hpp"
#include "core/phases/MonitoringPhase.hpp"
#include "core/phases/PredeployPhase.hpp"
#include "core/phases/SecurityPhase.hpp"

namespace cdp::core {

std::vector<std::unique_ptr<IPhase>> makeDefaultPhases() {
  std::vector<std::unique_ptr<IPhase>> vPhases;
  vPhases.push_back(std::make_unique<PredeployPhase>());
  vPhases.push_back(std::make_unique<InfrastructurePhase>());
  vPhases.push_back(std::make_unique<SecurityPhase>());
  vPhases.push_back(std::make_unique<ApplicationPhase>());
  vPhases.push_back(std::make_unique<MonitoringPhase>());
  vPhases.push_back(std::make_unique<HealthcheckPhase>());
  return vPhases;
}

}  // namespace cdp::core
