#pragma once

#include <string>

#include "cloud/GcloudCli.hpp"
#include "cloud/ISecretManager.hpp"

namespace cdp::cloud {

/// Secret Manager through `gcloud secrets`. Payloads are passed on stdin.
/// Class abbreviation: gsm
class GcloudSecretManager : public ISecretManager {
 public:
  explicit GcloudSecretManager(GcloudCli& gcCli);
  ~GcloudSecretManager() override;

  bool exists(const std::string& sName) override;
  bool create(const std::string& sName) override;
  bool addVersion(const std::string& sName, const std::string& sBytes) override;
  std::string accessLatest(const std::string& sName) override;
  bool grantAccessor(const std::string& sName, const std::string& sPrincipal) override;
  bool remove(const std::string& sName) override;

 private:
  GcloudCli& _gcCli;
};

}  // namespace cdp::cloud
