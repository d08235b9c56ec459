#pragma once

#include <string>
#include <vector>

#include "core/IPhase.hpp"

namespace cdp::core {

/// Phase 4: install and start the application. Produces the deployment report.
class ApplicationPhase : public IPhase {
 public:
  int ordinal() const override { return 4; }
  std::string label() const override { return "application"; }
  std::vector<dal::StateField> requiredFields() const override {
    return {dal::StateField::InstanceIdentity, dal::StateField::CredentialRef};
  }
  std::vector<dal::StateField> producedFields() const override {
    return {dal::StateField::DeploymentReport};
  }
  void execute(PhaseContext& pcContext) override;

 private:
  void uploadArchive(PhaseContext& pcContext, const std::string& sLocalPath);
};

}  // namespace cdp::core
