#pragma once

#include <optional>
#include <string>
#include <vector>

#include "cloud/ISecretManager.hpp"
#include "common/Types.hpp"

namespace cdp::cloud {

/// Pure abstract interface for the cloud control plane.
/// exists/create/remove are the per-kind existence predicate, create action
/// and delete action of a ResourceDescriptor.
class ICloudClient {
 public:
  virtual ~ICloudClient() = default;

  virtual std::string name() const = 0;

  // ── Ambient prerequisites ─────────────────────────────────────────────
  virtual bool isInstalled() = 0;
  virtual std::string activeAccount() = 0;
  virtual std::string activeProject() = 0;
  virtual std::vector<std::string> enabledServices() = 0;
  virtual bool enableService(const std::string& sService) = 0;

  // ── Resource lifecycle ────────────────────────────────────────────────
  /// False only when the backend reports the resource absent. Throws
  /// CloudCommandError when existence cannot be determined.
  virtual bool exists(const common::ResourceDescriptor& rdResource) = 0;
  virtual common::CreateResult create(const common::ResourceDescriptor& rdResource) = 0;
  virtual bool remove(const common::ResourceDescriptor& rdResource) = 0;

  // ── Inventory (read-only, used by the compliance guard) ───────────────
  virtual std::vector<common::InstanceInfo> listInstances(const std::string& sMachineType) = 0;
  virtual std::vector<common::DiskInfo> listDisks(const std::string& sDiskType) = 0;
  virtual std::vector<std::string> listStaticAddresses() = 0;
  virtual std::optional<std::string> billingAccount() = 0;

  // ── IAM ───────────────────────────────────────────────────────────────
  virtual bool grantProjectRole(const std::string& sMember, const std::string& sRole) = 0;

  // ── Instance operations ───────────────────────────────────────────────
  virtual std::optional<common::InstanceInfo> describeInstance(const std::string& sName,
                                                               const std::string& sZone) = 0;
  virtual bool startInstance(const std::string& sName, const std::string& sZone) = 0;
  virtual common::CommandResult runRemote(const std::string& sInstance, const std::string& sZone,
                                          const std::string& sCommand) = 0;
  virtual common::CommandResult copyToInstance(const std::string& sInstance,
                                               const std::string& sZone,
                                               const std::string& sLocalPath,
                                               const std::string& sRemotePath) = 0;

  virtual ISecretManager& secrets() = 0;
};

}  // namespace cdp::cloud
