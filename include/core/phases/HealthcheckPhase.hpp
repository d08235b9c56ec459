#pragma once

#include <string>
#include <vector>

#include "core/IPhase.hpp"

namespace cdp::core {

/// Phase 6: read-only probes against the running deployment. Every check runs;
/// the phase fails afterwards if any of them did.
class HealthcheckPhase : public IPhase {
 public:
  int ordinal() const override { return 6; }
  std::string label() const override { return "healthcheck"; }
  std::vector<dal::StateField> requiredFields() const override {
    return {dal::StateField::InstanceIdentity, dal::StateField::CredentialRef};
  }
  std::vector<dal::StateField> producedFields() const override { return {}; }
  bool mutatesCloud() const override { return false; }
  void execute(PhaseContext& pcContext) override;
};

}  // namespace cdp::core
