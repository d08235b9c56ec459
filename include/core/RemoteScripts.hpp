#pragma once

#include <string>
#include <utility>
#include <vector>

#include "common/Config.hpp"

/// Shell payloads executed on the provisioned VM. The orchestrator treats them
/// as opaque commands and only looks at their exit status.
namespace cdp::core::remote {

/// File the startup script touches once first-boot provisioning is done.
inline constexpr const char* kStartupMarker = "/var/log/startup-complete";

/// Instance metadata startup script: base packages, reverse proxy, app user.
std::string startupScript(const common::Config& cfg);

/// Exits 0 once the startup script has finished.
std::string startupCompleteCheck();

/// App user, directories, systemd unit and fail2ban jail. Services are enabled
/// but not started.
std::string configureHost(const common::Config& cfg);

/// Unpack an uploaded archive into the app directory.
std::string installArchive(const common::Config& cfg, const std::string& sRemoteArchive);

/// Fetch the API key from Secret Manager on the VM and write the app env file.
std::string renderAppConfig(const common::Config& cfg, const std::string& sSecretName);

std::string startServices(const common::Config& cfg);
std::string stopServices(const common::Config& cfg);
std::string localHealth(const common::Config& cfg);
std::string installMonitoringAgent();

/// Named health probes run by the healthcheck phase, in order.
std::vector<std::pair<std::string, std::string>> healthChecks(const common::Config& cfg);

/// Remote path an application archive is uploaded to.
std::string archiveUploadPath(const common::Config& cfg);

}  // namespace cdp::core::remote
