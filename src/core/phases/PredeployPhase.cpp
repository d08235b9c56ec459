#include "core/phases/PredeployPhase.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <algorithm>

namespace cdp::core {

const std::vector<std::string>& PredeployPhase::requiredServices() {
  static const std::vector<std::string> vServices = {
      "compute.googleapis.com",       "logging.googleapis.com",
      "monitoring.googleapis.com",    "secretmanager.googleapis.com",
      "cloudbilling.googleapis.com",  "billingbudgets.googleapis.com",
  };
  return vServices;
}

void PredeployPhase::execute(PhaseContext& pcContext) {
  auto spLog = common::Logger::get();
  auto& icClient = pcContext.client();

  const auto vEnabled = icClient.enabledServices();
  for (const auto& sService : requiredServices()) {
    if (std::find(vEnabled.begin(), vEnabled.end(), sService) != vEnabled.end()) {
      spLog->info("API {} already enabled", sService);
      continue;
    }
    spLog->info("Enabling API {}", sService);
    if (!icClient.enableService(sService)) {
      throw common::ReconciliationError("service_enable_failed",
                                        "Could not enable API " + sService);
    }
  }

  if (!icClient.billingAccount()) {
    pcContext.warn("budget", "No billing account linked; skipping the budget alert");
    return;
  }
  pcContext.ensure(pcContext.catalog().budget());
}

}  // namespace cdp::core
