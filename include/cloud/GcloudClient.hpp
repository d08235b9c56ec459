#pragma once

#include <optional>
#include <string>
#include <vector>

#include "cloud/GcloudCli.hpp"
#include "cloud/GcloudSecretManager.hpp"
#include "cloud/ICloudClient.hpp"

namespace cdp::cloud {

/// Google Cloud control plane driven through the gcloud CLI.
/// Class abbreviation: gcc
class GcloudClient : public ICloudClient {
 public:
  GcloudClient(IProcessRunner& prRunner, std::string sProjectId);
  ~GcloudClient() override;

  GcloudClient(const GcloudClient&) = delete;
  GcloudClient& operator=(const GcloudClient&) = delete;

  std::string name() const override;

  bool isInstalled() override;
  std::string activeAccount() override;
  std::string activeProject() override;
  std::vector<std::string> enabledServices() override;
  bool enableService(const std::string& sService) override;

  bool exists(const common::ResourceDescriptor& rdResource) override;
  common::CreateResult create(const common::ResourceDescriptor& rdResource) override;
  bool remove(const common::ResourceDescriptor& rdResource) override;

  std::vector<common::InstanceInfo> listInstances(const std::string& sMachineType) override;
  std::vector<common::DiskInfo> listDisks(const std::string& sDiskType) override;
  std::vector<std::string> listStaticAddresses() override;
  std::optional<std::string> billingAccount() override;

  bool grantProjectRole(const std::string& sMember, const std::string& sRole) override;

  std::optional<common::InstanceInfo> describeInstance(const std::string& sName,
                                                       const std::string& sZone) override;
  bool startInstance(const std::string& sName, const std::string& sZone) override;
  common::CommandResult runRemote(const std::string& sInstance, const std::string& sZone,
                                  const std::string& sCommand) override;
  common::CommandResult copyToInstance(const std::string& sInstance, const std::string& sZone,
                                       const std::string& sLocalPath,
                                       const std::string& sRemotePath) override;

  ISecretManager& secrets() override;

  /// Map a compute instance JSON object onto InstanceInfo.
  static common::InstanceInfo parseInstance(const nlohmann::json& jInstance);

 private:
  /// gcloud command group and location flag for describe/create/delete.
  std::vector<std::string> describeArgs(const common::ResourceDescriptor& rdResource) const;
  std::vector<std::string> deleteArgs(const common::ResourceDescriptor& rdResource) const;

  /// Server-assigned names of monitoring/billing objects with this display name.
  std::vector<std::string> findByDisplayName(const common::ResourceDescriptor& rdResource);

  common::CreateResult createInstance(const common::ResourceDescriptor& rdResource);
  common::CreateResult createFromFile(const common::ResourceDescriptor& rdResource);
  common::CreateResult createBudget(const common::ResourceDescriptor& rdResource);

  GcloudCli _gcCli;
  GcloudSecretManager _gsmSecrets;
};

}  // namespace cdp::cloud
