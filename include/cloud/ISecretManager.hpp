#pragma once

#include <string>

namespace cdp::cloud {

/// Pure abstract interface for the secret storage service.
/// Secret bytes only ever travel through addVersion/accessLatest; callers
/// must not persist them.
class ISecretManager {
 public:
  virtual ~ISecretManager() = default;

  virtual bool exists(const std::string& sName) = 0;
  virtual bool create(const std::string& sName) = 0;
  virtual bool addVersion(const std::string& sName, const std::string& sBytes) = 0;

  /// Latest version payload, empty if the secret has no enabled version.
  virtual std::string accessLatest(const std::string& sName) = 0;

  virtual bool grantAccessor(const std::string& sName, const std::string& sPrincipal) = 0;
  virtual bool remove(const std::string& sName) = 0;
};

}  // namespace cdp::cloud
