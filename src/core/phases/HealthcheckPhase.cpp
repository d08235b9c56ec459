#include "core/phases/HealthcheckPhase.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/RemoteScripts.hpp"

namespace cdp::core {

void HealthcheckPhase::execute(PhaseContext& pcContext) {
  auto spLog = common::Logger::get();

  std::vector<std::string> vFailed;
  for (const auto& [sName, sCommand] : remote::healthChecks(pcContext.config())) {
    if (pcContext.tryRemote(sCommand).ok()) {
      spLog->info("[PASS] {}", sName);
    } else {
      spLog->error("[FAIL] {}", sName);
      vFailed.push_back(sName);
    }
  }

  if (vFailed.empty()) return;

  std::string sList;
  for (const auto& s : vFailed) {
    if (!sList.empty()) sList += ", ";
    sList += s;
  }
  throw common::ReconciliationError("healthcheck_failed",
                                    std::to_string(vFailed.size()) +
                                        " health check(s) failed: " + sList);
}

}  // namespace cdp::core
