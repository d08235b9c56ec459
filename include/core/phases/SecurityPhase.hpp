#pragma once

#include <string>
#include <vector>

#include "core/IPhase.hpp"

namespace cdp::core {

/// Phase 3: API key secret and host hardening. Produces the credential
/// reference.
class SecurityPhase : public IPhase {
 public:
  int ordinal() const override { return 3; }
  std::string label() const override { return "security"; }
  std::vector<dal::StateField> requiredFields() const override {
    return {dal::StateField::InstanceIdentity};
  }
  std::vector<dal::StateField> producedFields() const override {
    return {dal::StateField::CredentialRef};
  }
  void execute(PhaseContext& pcContext) override;

 private:
  /// Reuse the latest secret version or add a freshly generated key.
  /// Returns the key fingerprint.
  std::string provisionApiKey(PhaseContext& pcContext, const std::string& sSecretName);
};

}  // namespace cdp::core
