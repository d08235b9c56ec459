#pragma once

#include <string>
#include <vector>

#include "core/IPhase.hpp"

namespace cdp::core {

/// Phase 1: enable service APIs and set up the optional budget alert.
class PredeployPhase : public IPhase {
 public:
  int ordinal() const override { return 1; }
  std::string label() const override { return "predeploy"; }
  std::vector<dal::StateField> requiredFields() const override { return {}; }
  std::vector<dal::StateField> producedFields() const override { return {}; }
  void execute(PhaseContext& pcContext) override;

  static const std::vector<std::string>& requiredServices();
};

}  // namespace cdp::core
