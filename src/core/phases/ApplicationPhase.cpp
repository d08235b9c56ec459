#include "core/phases/ApplicationPhase.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/RemoteScripts.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>

namespace cdp::core {

namespace {
std::string nowLocal() {
  const std::time_t tNow = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tmLocal{};
  localtime_r(&tNow, &tmLocal);
  char vBuf[32];
  std::strftime(vBuf, sizeof(vBuf), "%Y-%m-%d %H:%M:%S", &tmLocal);
  return vBuf;
}
}  // namespace

void ApplicationPhase::execute(PhaseContext& pcContext) {
  const auto& cfg = pcContext.config();
  const auto& iid = pcContext.state().instance();
  const auto& crf = pcContext.state().credential();

  if (cfg.oAppArchivePath) {
    uploadArchive(pcContext, *cfg.oAppArchivePath);
  } else {
    common::Logger::get()->info("APP_ARCHIVE not set; keeping the application already on {}",
                                iid.sName);
  }

  pcContext.runRemote("render app config", remote::renderAppConfig(cfg, crf.sSecretName));
  pcContext.runRemote("start services", remote::startServices(cfg));
  pcContext.runRemote("local health", remote::localHealth(cfg));

  dal::DeploymentReport drp;
  drp.sDeployedAt = nowLocal();
  drp.sEnvironment = cfg.sEnvironment;
  drp.sProjectId = cfg.sProjectId;
  if (!iid.sExternalIp.empty()) {
    drp.sHttpUrl = "http://" + iid.sExternalIp;
    drp.sHttpsUrl = "https://" + iid.sExternalIp;
    drp.sHealthUrl = "https://" + iid.sExternalIp + "/health";
  }
  pcContext.state().oReport = drp;
}

void ApplicationPhase::uploadArchive(PhaseContext& pcContext, const std::string& sLocalPath) {
  if (!std::filesystem::is_regular_file(sLocalPath)) {
    throw common::ConfigError("missing_archive", "APP_ARCHIVE not found: " + sLocalPath);
  }

  const auto& cfg = pcContext.config();
  const auto& iid = pcContext.state().instance();
  const std::string sRemote = remote::archiveUploadPath(cfg);

  common::Logger::get()->info("Uploading {} to {}:{}", sLocalPath, iid.sName, sRemote);
  auto cmr = pcContext.client().copyToInstance(iid.sName, iid.sZone, sLocalPath, sRemote);
  if (!cmr.ok()) {
    throw common::ReconciliationError(
        "upload_failed", "Could not upload " + sLocalPath + " (exit " +
                             std::to_string(cmr.iExitCode) + ")");
  }
  pcContext.runRemote("install archive", remote::installArchive(cfg, sRemote));
}

}  // namespace cdp::core
