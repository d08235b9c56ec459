#pragma once

#include <string>
#include <vector>

#include "core/PhaseContext.hpp"
#include "dal/DeploymentState.hpp"

namespace cdp::core {

/// One ordinal pipeline stage. The orchestrator checks requiredFields()
/// before execute() and persists producedFields() after it.
class IPhase {
 public:
  virtual ~IPhase() = default;

  virtual int ordinal() const = 0;
  virtual std::string label() const = 0;
  virtual std::vector<dal::StateField> requiredFields() const = 0;
  virtual std::vector<dal::StateField> producedFields() const = 0;

  /// False for phases that only read cloud state. Compliance is evaluated
  /// only when a selected phase mutates.
  virtual bool mutatesCloud() const { return true; }

  /// Throws an AppError subclass on failure.
  virtual void execute(PhaseContext& pcContext) = 0;
};

}  // namespace cdp::core
