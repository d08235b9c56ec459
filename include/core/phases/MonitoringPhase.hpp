#pragma once

#include <string>
#include <vector>

#include "core/IPhase.hpp"

namespace cdp::core {

/// Phase 5: ops agent plus uptime check, alert policies, dashboard and log
/// metrics. Every artifact here is optional.
class MonitoringPhase : public IPhase {
 public:
  int ordinal() const override { return 5; }
  std::string label() const override { return "monitoring"; }
  std::vector<dal::StateField> requiredFields() const override {
    return {dal::StateField::InstanceIdentity};
  }
  std::vector<dal::StateField> producedFields() const override { return {}; }
  void execute(PhaseContext& pcContext) override;
};

}  // namespace cdp::core
