#include "core/CleanupEngine.hpp"

#include "common/Logger.hpp"
#include "core/RemoteScripts.hpp"
#include "core/ResourceNaming.hpp"

#include <exception>
#include <optional>

namespace cdp::core {

size_t CleanupReport::pendingCount() const {
  if (mode == CleanupMode::Execute) return vSurvivors.size() + vRemainingState.size();
  size_t nPending = vLocalState.size();
  for (const auto& ci : vItems) {
    if (ci.bExisted) ++nPending;
  }
  return nPending;
}

CleanupEngine::CleanupEngine(const common::Config& cfg, cloud::ICloudClient& icClient,
                             const ResourceCatalog& rcCatalog, dal::StateStore& ssStore)
    : _cfg(cfg), _icClient(icClient), _rcCatalog(rcCatalog), _ssStore(ssStore) {}

CleanupEngine::~CleanupEngine() = default;

std::optional<bool> CleanupEngine::probe(const common::ResourceDescriptor& rdResource,
                                         CleanupReport& crpReport) {
  try {
    return _icClient.exists(rdResource);
  } catch (const std::exception& ex) {
    const std::string sWhat = kindLabel(rdResource.kind) + " " + rdResource.sName;
    common::Logger::get()->warn("Could not check {}: {}", sWhat, ex.what());
    crpReport.vWarnings.push_back({sWhat, std::string("existence check failed: ") + ex.what()});
    return std::nullopt;
  }
}

CleanupReport CleanupEngine::cleanup(CleanupMode mode) {
  auto spLog = common::Logger::get();
  CleanupReport crp;
  crp.mode = mode;

  if (mode == CleanupMode::Execute) {
    stopServices(crp);
  }

  for (const auto& rd : _rcCatalog.deletionOrder()) {
    CleanupItem ci;
    ci.kind = rd.kind;
    ci.sName = rd.sName;
    const std::string sWhat = kindLabel(rd.kind) + " " + rd.sName;

    auto oExists = probe(rd, crp);
    // An unknown state is still worth a delete attempt in execute mode
    ci.bExisted = oExists.value_or(mode == CleanupMode::Execute);
    if (!ci.bExisted) {
      spLog->debug("{} not found", sWhat);
      crp.vItems.push_back(ci);
      continue;
    }

    if (mode == CleanupMode::DryRun) {
      spLog->info("Would delete {}", sWhat);
    } else {
      spLog->info("Deleting {}", sWhat);
      std::string sReason = "delete action failed";
      try {
        ci.bDeleted = _icClient.remove(rd);
      } catch (const std::exception& ex) {
        sReason = ex.what();
      }
      if (!ci.bDeleted) {
        spLog->warn("Failed to delete {}: {}; continuing", sWhat, sReason);
        crp.vWarnings.push_back({sWhat, sReason});
      }
    }
    crp.vItems.push_back(ci);
  }

  for (auto field : dal::allStateFields()) {
    if (!_ssStore.exists(field)) continue;
    crp.vLocalState.push_back(_ssStore.pathFor(field).string());
    if (mode == CleanupMode::DryRun) {
      spLog->info("Would remove local state {}", crp.vLocalState.back());
    }
  }
  if (mode == CleanupMode::Execute) {
    try {
      for (const auto& sPath : _ssStore.removeAll()) {
        spLog->info("Removed local state {}", sPath);
      }
    } catch (const std::exception& ex) {
      spLog->warn("Could not remove local state: {}", ex.what());
      crp.vWarnings.push_back({"local-state", ex.what()});
    }
    verify(crp);
  }
  return crp;
}

void CleanupEngine::stopServices(CleanupReport& crpReport) {
  const auto rdInstance = _rcCatalog.instance();
  auto oExists = probe(rdInstance, crpReport);
  if (!oExists.value_or(false)) return;

  common::Logger::get()->info("Stopping services on {}", rdInstance.sName);
  try {
    auto cmr = _icClient.runRemote(rdInstance.sName, rdInstance.sLocation,
                                   remote::stopServices(_cfg));
    if (!cmr.ok()) {
      crpReport.vWarnings.push_back(
          {"stop-services", "exit " + std::to_string(cmr.iExitCode) + " on " + rdInstance.sName});
    }
  } catch (const std::exception& ex) {
    crpReport.vWarnings.push_back({"stop-services", ex.what()});
  }
}

void CleanupEngine::verify(CleanupReport& crpReport) {
  auto spLog = common::Logger::get();
  for (const auto& rd : _rcCatalog.deletionOrder()) {
    auto oExists = probe(rd, crpReport);
    if (!oExists.value_or(false)) continue;
    spLog->warn("{} {} still exists (possibly eventual consistency lag)", kindLabel(rd.kind),
                rd.sName);
    crpReport.vSurvivors.push_back({rd.kind, rd.sName, true, false});
  }
  for (auto field : dal::allStateFields()) {
    if (_ssStore.exists(field)) {
      crpReport.vRemainingState.push_back(_ssStore.pathFor(field).string());
    }
  }
  if (crpReport.vSurvivors.empty() && crpReport.vRemainingState.empty()) {
    spLog->info("Verification passed: no managed resources remain");
  }
}

}  // namespace cdp::core
