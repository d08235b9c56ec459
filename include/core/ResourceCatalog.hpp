#pragma once

#include <string>
#include <vector>

#include "common/Config.hpp"
#include "common/Types.hpp"

namespace cdp::core {

/// Builds every ResourceDescriptor of one deployment from the configuration.
/// Descriptors are constructed fresh on each call; names come from
/// resourceName() so the same configuration always yields the same set.
/// Class abbreviation: rc
class ResourceCatalog {
 public:
  explicit ResourceCatalog(const common::Config& cfg);
  ~ResourceCatalog();

  common::ResourceDescriptor network() const;
  common::ResourceDescriptor subnet() const;
  std::vector<common::ResourceDescriptor> firewallRules() const;
  common::ResourceDescriptor serviceAccount() const;
  common::ResourceDescriptor disk() const;
  common::ResourceDescriptor instance() const;
  common::ResourceDescriptor apiKeySecret() const;
  common::ResourceDescriptor budget() const;

  /// Uptime check against sHost. An empty host is fine for lookups by name.
  common::ResourceDescriptor uptimeCheck(const std::string& sHost) const;
  std::vector<common::ResourceDescriptor> alertPolicies() const;
  common::ResourceDescriptor dashboard() const;
  std::vector<common::ResourceDescriptor> logMetrics() const;

  /// Phase 2 resources in creation order: network, subnet, firewall rules,
  /// service account, disk, instance.
  std::vector<common::ResourceDescriptor> infrastructure() const;

  /// Phase 5 resources. The uptime check is omitted when sHost is empty.
  std::vector<common::ResourceDescriptor> monitoring(const std::string& sHost) const;

  /// Every cloud resource the pipeline can create, in safe deletion order.
  std::vector<common::ResourceDescriptor> deletionOrder() const;

  std::string serviceAccountEmail() const;
  std::string serviceAccountMember() const;
  std::string apiKeySecretName() const;
  const std::string& prefix() const { return _sPrefix; }

  static constexpr const char* kSubnetRange = "10.0.1.0/24";
  static constexpr const char* kInstancePrivateIp = "10.0.1.10";

 private:
  std::string networkTag(const std::string& sQualifier) const;

  const common::Config& _cfg;
  std::string _sPrefix;
};

}  // namespace cdp::core
