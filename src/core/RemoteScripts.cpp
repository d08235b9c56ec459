#include "core/RemoteScripts.hpp"

namespace cdp::core::remote {

namespace {

std::string appDir(const common::Config& cfg) { return "/opt/" + cfg.sAppName; }
std::string envFile(const common::Config& cfg) { return "/etc/" + cfg.sAppName + "/env"; }
std::string localUrl(const common::Config& cfg, const std::string& sPath) {
  return "http://localhost:" + std::to_string(cfg.iAppPort) + sPath;
}

}  // namespace

std::string startupScript(const common::Config& cfg) {
  return "#!/bin/bash\n"
         "set -euo pipefail\n"
         "exec >>/var/log/startup-script.log 2>&1\n"
         "export DEBIAN_FRONTEND=noninteractive\n"
         "apt-get update -y\n"
         "apt-get install -y curl jq ufw fail2ban debian-keyring debian-archive-keyring "
         "apt-transport-https gnupg\n"
         "curl -1sLf https://dl.cloudsmith.io/public/caddy/stable/gpg.key"
         " | gpg --dearmor --yes -o /usr/share/keyrings/caddy-stable-archive-keyring.gpg\n"
         "curl -1sLf https://dl.cloudsmith.io/public/caddy/stable/debian.deb.txt"
         " > /etc/apt/sources.list.d/caddy-stable.list\n"
         "apt-get update -y\n"
         "apt-get install -y caddy\n"
         "useradd -r -s /bin/false -d " + appDir(cfg) + " " + cfg.sAppName + " || true\n"
         "mkdir -p " + appDir(cfg) + "\n"
         "chown " + cfg.sAppName + ":" + cfg.sAppName + " " + appDir(cfg) + "\n"
         "ufw --force reset\n"
         "ufw default deny incoming\n"
         "ufw default allow outgoing\n"
         "ufw allow 22/tcp\n"
         "ufw allow 80/tcp\n"
         "ufw allow 443/tcp\n"
         "ufw --force enable\n"
         "grep -q '^vm.swappiness' /etc/sysctl.conf || echo 'vm.swappiness = 1' >> /etc/sysctl.conf\n"
         "sysctl -p\n"
         "touch " + std::string(kStartupMarker) + "\n";
}

std::string startupCompleteCheck() { return "test -f " + std::string(kStartupMarker); }

std::string configureHost(const common::Config& cfg) {
  const std::string& sApp = cfg.sAppName;
  return "set -euo pipefail\n"
         "id -u " + sApp + " >/dev/null 2>&1 || sudo useradd -r -s /bin/false -d " +
         appDir(cfg) + " " + sApp + "\n"
         "sudo mkdir -p " + appDir(cfg) + " /etc/" + sApp + "\n"
         "sudo chown -R " + sApp + ":" + sApp + " " + appDir(cfg) + "\n"
         "sudo chmod 750 /etc/" + sApp + "\n"
         "sudo tee /etc/systemd/system/" + sApp + ".service >/dev/null <<'UNIT'\n"
         "[Unit]\n"
         "Description=" + sApp + "\n"
         "After=network.target\n"
         "Wants=caddy.service\n"
         "[Service]\n"
         "Type=simple\n"
         "Restart=always\n"
         "RestartSec=10\n"
         "User=" + sApp + "\n"
         "WorkingDirectory=" + appDir(cfg) + "\n"
         "EnvironmentFile=" + envFile(cfg) + "\n"
         "ExecStart=" + appDir(cfg) + "/start.sh\n"
         "MemoryMax=800M\n"
         "NoNewPrivileges=true\n"
         "PrivateTmp=true\n"
         "ProtectSystem=strict\n"
         "ReadWritePaths=" + appDir(cfg) + "\n"
         "[Install]\n"
         "WantedBy=multi-user.target\n"
         "UNIT\n"
         "sudo tee /etc/fail2ban/jail.local >/dev/null <<'JAIL'\n"
         "[DEFAULT]\n"
         "bantime = 3600\n"
         "findtime = 600\n"
         "maxretry = 3\n"
         "backend = systemd\n"
         "[sshd]\n"
         "enabled = true\n"
         "JAIL\n"
         "sudo systemctl daemon-reload\n"
         "sudo systemctl enable caddy " + sApp + "\n"
         "sudo systemctl enable fail2ban\n"
         "sudo systemctl restart fail2ban\n";
}

std::string archiveUploadPath(const common::Config& cfg) {
  return "/tmp/" + cfg.sAppName + "-app.tar.gz";
}

std::string installArchive(const common::Config& cfg, const std::string& sRemoteArchive) {
  return "set -euo pipefail\n"
         "sudo systemctl stop " + cfg.sAppName + " || true\n"
         "sudo find " + appDir(cfg) + " -mindepth 1 -delete\n"
         "sudo tar -xzf " + sRemoteArchive + " -C " + appDir(cfg) + "\n"
         "sudo chown -R " + cfg.sAppName + ":" + cfg.sAppName + " " + appDir(cfg) + "\n"
         "test -x " + appDir(cfg) + "/start.sh\n"
         "rm -f " + sRemoteArchive + "\n";
}

std::string renderAppConfig(const common::Config& cfg, const std::string& sSecretName) {
  return "set -euo pipefail\n"
         "KEY=$(gcloud secrets versions access latest --secret=" + sSecretName + ")\n"
         "umask 077\n"
         "printf 'PORT=%s\\nAPI_KEY=%s\\n' " + std::to_string(cfg.iAppPort) +
         " \"$KEY\" | sudo tee " + envFile(cfg) + " >/dev/null\n"
         "sudo chown " + cfg.sAppName + ":" + cfg.sAppName + " " + envFile(cfg) + "\n"
         "sudo chmod 600 " + envFile(cfg) + "\n";
}

std::string startServices(const common::Config& cfg) {
  return "set -euo pipefail\n"
         "sudo systemctl restart caddy\n"
         "sudo systemctl restart " + cfg.sAppName + "\n"
         "sleep 5\n"
         "systemctl is-active --quiet caddy\n"
         "systemctl is-active --quiet " + cfg.sAppName + "\n";
}

std::string stopServices(const common::Config& cfg) {
  return "sudo systemctl stop " + cfg.sAppName + " caddy || true";
}

std::string localHealth(const common::Config& cfg) {
  return "curl -fsS -m 10 " + localUrl(cfg, "/health") + " >/dev/null";
}

std::string installMonitoringAgent() {
  return "set -euo pipefail\n"
         "if ! systemctl list-unit-files google-cloud-ops-agent.service >/dev/null 2>&1; then\n"
         "  curl -sSO https://dl.google.com/cloudagents/add-google-cloud-ops-agent-repo.sh\n"
         "  sudo bash add-google-cloud-ops-agent-repo.sh --also-install\n"
         "  rm -f add-google-cloud-ops-agent-repo.sh\n"
         "fi\n"
         "sudo systemctl restart google-cloud-ops-agent\n";
}

std::vector<std::pair<std::string, std::string>> healthChecks(const common::Config& cfg) {
  return {
      {"services-active",
       "systemctl is-active --quiet caddy && systemctl is-active --quiet " + cfg.sAppName},
      {"local-health", localHealth(cfg)},
      {"auth-required",
       "code=$(curl -s -o /dev/null -w '%{http_code}' -m 10 " + localUrl(cfg, "/v1/messages") +
           "); [ \"$code\" = 401 ] || [ \"$code\" = 403 ]"},
      {"https-redirect",
       "curl -s -o /dev/null -w '%{http_code}' -m 10 http://localhost/ | grep -Eq '^30[1278]$'"},
      {"outbound-connectivity", "curl -fsS -m 10 -o /dev/null https://www.google.com"},
  };
}

}  // namespace cdp::core::remote
