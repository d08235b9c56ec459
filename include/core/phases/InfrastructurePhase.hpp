#pragma once

#include <string>
#include <vector>

#include "core/IPhase.hpp"

namespace cdp::core {

/// Phase 2: network, firewall, service account, disk and the VM itself.
/// Produces the instance identity.
class InfrastructurePhase : public IPhase {
 public:
  int ordinal() const override { return 2; }
  std::string label() const override { return "infrastructure"; }
  std::vector<dal::StateField> requiredFields() const override { return {}; }
  std::vector<dal::StateField> producedFields() const override {
    return {dal::StateField::InstanceIdentity};
  }
  void execute(PhaseContext& pcContext) override;

  static const std::vector<std::string>& serviceAccountRoles();

 private:
  void grantRoles(PhaseContext& pcContext);
  void startIfStopped(PhaseContext& pcContext, const common::ResourceDescriptor& rdInstance);
  void waitForStartup(PhaseContext& pcContext);
  void recordIdentity(PhaseContext& pcContext, const common::ResourceDescriptor& rdInstance);
};

}  // namespace cdp::core
