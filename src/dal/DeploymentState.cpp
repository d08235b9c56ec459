#include "dal/DeploymentState.hpp"

#include "common/Errors.hpp"

#include <stdexcept>

namespace cdp::dal {

namespace {

const StateFieldInfo kFieldInfo[] = {
    {StateField::InstanceIdentity, "instance-info.env", "INSTANCE_NAME", 2, "infrastructure",
     false},
    {StateField::CredentialRef, "credential-ref.env", "API_KEY_SECRET_NAME", 3, "security", true},
    {StateField::DeploymentReport, "deployment-info.env", "DEPLOYED_AT", 4, "application",
     false},
};

}  // namespace

const StateFieldInfo& fieldInfo(StateField field) {
  for (const auto& sfi : kFieldInfo) {
    if (sfi.field == field) return sfi;
  }
  throw std::logic_error("fieldInfo: unhandled state field");
}

const std::vector<StateField>& allStateFields() {
  static const std::vector<StateField> vFields = {
      StateField::InstanceIdentity, StateField::CredentialRef, StateField::DeploymentReport};
  return vFields;
}

std::string fieldLabel(StateField field) {
  switch (field) {
    case StateField::InstanceIdentity: return "instance identity";
    case StateField::CredentialRef:    return "credential reference";
    case StateField::DeploymentReport: return "deployment report";
  }
  throw std::logic_error("fieldLabel: unhandled state field");
}

bool DeploymentState::has(StateField field) const {
  switch (field) {
    case StateField::InstanceIdentity: return oInstance.has_value();
    case StateField::CredentialRef:    return oCredential.has_value();
    case StateField::DeploymentReport: return oReport.has_value();
  }
  return false;
}

void DeploymentState::require(StateField field) const {
  if (has(field)) return;
  const auto& sfi = fieldInfo(field);
  throw common::MissingStateError(
      sfi.pPrimaryKey, "Missing " + fieldLabel(field) + " (" + sfi.pPrimaryKey + " in " +
                           sfi.pFileName + "); run phase " + std::to_string(sfi.iProducerPhase) +
                           " (" + sfi.pProducerLabel + ") first");
}

const InstanceIdentity& DeploymentState::instance() const {
  require(StateField::InstanceIdentity);
  return *oInstance;
}

const CredentialRef& DeploymentState::credential() const {
  require(StateField::CredentialRef);
  return *oCredential;
}

const DeploymentReport& DeploymentState::report() const {
  require(StateField::DeploymentReport);
  return *oReport;
}

}  // namespace cdp::dal
