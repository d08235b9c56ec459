#include "cloud/GcloudSecretManager.hpp"

namespace cdp::cloud {

namespace {
constexpr const char* kAccessorRole = "roles/secretmanager.secretAccessor";
}  // namespace

GcloudSecretManager::GcloudSecretManager(GcloudCli& gcCli) : _gcCli(gcCli) {}
GcloudSecretManager::~GcloudSecretManager() = default;

bool GcloudSecretManager::exists(const std::string& sName) {
  return _gcCli.execExists("secret " + sName, {"secrets", "describe", sName, "--format=json"});
}

bool GcloudSecretManager::create(const std::string& sName) {
  return _gcCli
      .exec({"secrets", "create", sName, "--replication-policy=automatic",
             "--labels=managed-by=cloud-deployer"})
      .ok();
}

bool GcloudSecretManager::addVersion(const std::string& sName, const std::string& sBytes) {
  return _gcCli.exec({"secrets", "versions", "add", sName, "--data-file=-"}, sBytes).ok();
}

std::string GcloudSecretManager::accessLatest(const std::string& sName) {
  auto cmr = _gcCli.exec({"secrets", "versions", "access", "latest", "--secret=" + sName});
  if (!cmr.ok()) {
    return {};
  }
  return cmr.sStdout;
}

bool GcloudSecretManager::grantAccessor(const std::string& sName,
                                        const std::string& sPrincipal) {
  return _gcCli
      .exec({"secrets", "add-iam-policy-binding", sName, "--member=" + sPrincipal,
             std::string("--role=") + kAccessorRole})
      .ok();
}

bool GcloudSecretManager::remove(const std::string& sName) {
  return _gcCli.exec({"secrets", "delete", sName}).ok();
}

}  // namespace cdp::cloud
