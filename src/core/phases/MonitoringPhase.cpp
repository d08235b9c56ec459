#include "core/phases/MonitoringPhase.hpp"

#include "common/Logger.hpp"
#include "core/RemoteScripts.hpp"

namespace cdp::core {

void MonitoringPhase::execute(PhaseContext& pcContext) {
  const auto& iid = pcContext.state().instance();

  auto cmr = pcContext.tryRemote(remote::installMonitoringAgent());
  if (!cmr.ok()) {
    pcContext.warn("ops-agent", "Monitoring agent install failed (exit " +
                                    std::to_string(cmr.iExitCode) + ")");
  }

  if (iid.sExternalIp.empty()) {
    pcContext.warn("uptime-check", "No external address recorded; skipping the uptime check");
  }
  for (const auto& rd : pcContext.catalog().monitoring(iid.sExternalIp)) {
    pcContext.ensure(rd);
  }
  common::Logger::get()->info("Monitoring configured for {}", iid.sName);
}

}  // namespace cdp::core
