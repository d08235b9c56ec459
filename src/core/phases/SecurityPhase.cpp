#include "core/phases/SecurityPhase.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/RemoteScripts.hpp"
#include "security/CredentialService.hpp"

namespace cdp::core {

namespace {
std::string trimmed(std::string sValue) {
  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ')) {
    sValue.pop_back();
  }
  return sValue;
}
}  // namespace

void SecurityPhase::execute(PhaseContext& pcContext) {
  const auto& rcCatalog = pcContext.catalog();
  auto& smSecrets = pcContext.client().secrets();

  const auto rdSecret = rcCatalog.apiKeySecret();
  pcContext.ensure(rdSecret);
  const std::string sFingerprint = provisionApiKey(pcContext, rdSecret.sName);

  const std::string sMember = rcCatalog.serviceAccountMember();
  if (!smSecrets.grantAccessor(rdSecret.sName, sMember)) {
    throw common::ReconciliationError(
        "secret_grant_failed", "Could not grant " + sMember + " access to " + rdSecret.sName);
  }

  pcContext.runRemote("configure host", remote::configureHost(pcContext.config()));

  dal::CredentialRef crf;
  crf.sSecretName = rdSecret.sName;
  crf.sServiceAccount = rcCatalog.serviceAccountEmail();
  crf.sKeyFingerprint = sFingerprint;
  pcContext.state().oCredential = crf;
}

std::string SecurityPhase::provisionApiKey(PhaseContext& pcContext,
                                           const std::string& sSecretName) {
  auto spLog = common::Logger::get();
  auto& smSecrets = pcContext.client().secrets();

  std::string sKey = trimmed(smSecrets.accessLatest(sSecretName));
  if (!sKey.empty()) {
    spLog->info("Reusing the latest version of secret {}", sSecretName);
  } else {
    spLog->info("Generating a new API key for secret {}", sSecretName);
    sKey = security::CredentialService::generateApiKey();
    if (!smSecrets.addVersion(sSecretName, sKey)) {
      security::CredentialService::cleanse(sKey);
      throw common::ReconciliationError("secret_version_failed",
                                        "Could not add a version to secret " + sSecretName);
    }
  }

  std::string sFingerprint = security::CredentialService::fingerprint(sKey);
  security::CredentialService::cleanse(sKey);
  return sFingerprint;
}

}  // namespace cdp::core
