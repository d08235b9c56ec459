#pragma once

#include <optional>
#include <string>
#include <vector>

namespace cdp::dal {

/// Produced by phase 2.
/// Class abbreviation: iid
struct InstanceIdentity {
  std::string sName;
  std::string sZone;
  std::string sInternalIp;
  std::string sExternalIp;
};

/// Pointer to the API key in Secret Manager. Never holds the key itself.
/// Produced by phase 3.
/// Class abbreviation: crf
struct CredentialRef {
  std::string sSecretName;
  std::string sServiceAccount;
  std::string sKeyFingerprint;
};

/// Produced by phase 4.
/// Class abbreviation: drp
struct DeploymentReport {
  std::string sDeployedAt;
  std::string sEnvironment;
  std::string sProjectId;
  std::string sHttpUrl;
  std::string sHttpsUrl;
  std::string sHealthUrl;
};

/// One persisted state category. Each maps to its own file.
enum class StateField { InstanceIdentity, CredentialRef, DeploymentReport };

/// Static facts about a StateField: file name, flat keys, producing phase.
struct StateFieldInfo {
  StateField field;
  const char* pFileName;
  const char* pPrimaryKey;  // its presence marks the record as written
  int iProducerPhase;
  const char* pProducerLabel;
  bool bSensitive;  // stored with mode 0600
};

const StateFieldInfo& fieldInfo(StateField field);
const std::vector<StateField>& allStateFields();

/// "instance identity", "credential reference", "deployment report".
std::string fieldLabel(StateField field);

/// Typed cross-phase state. Accessors throw MissingStateError naming the
/// missing key and the phase that produces it.
/// Class abbreviation: ds
struct DeploymentState {
  std::optional<InstanceIdentity> oInstance;
  std::optional<CredentialRef> oCredential;
  std::optional<DeploymentReport> oReport;

  bool has(StateField field) const;

  /// Throws MissingStateError when the field is absent.
  void require(StateField field) const;

  const InstanceIdentity& instance() const;
  const CredentialRef& credential() const;
  const DeploymentReport& report() const;
};

}  // namespace cdp::dal
