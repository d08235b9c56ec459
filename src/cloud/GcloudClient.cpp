#include "cloud/GcloudClient.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

namespace cdp::cloud {

using common::ResourceKind;

namespace {

constexpr const char* kCloudPlatformScope = "https://www.googleapis.com/auth/cloud-platform";

/// Payload file handed to --*-from-file flags. Mode 0600, removed on scope exit.
class ScopedTempFile {
 public:
  explicit ScopedTempFile(const std::string& sContent) {
    std::string sPattern =
        (std::filesystem::temp_directory_path() / "cdp-payload-XXXXXX").string();
    std::vector<char> vPath(sPattern.begin(), sPattern.end());
    vPath.push_back('\0');

    int iFd = ::mkstemp(vPath.data());
    if (iFd == -1) {
      throw std::system_error(errno, std::generic_category(), "mkstemp failed");
    }
    _sPath = vPath.data();

    size_t nWritten = 0;
    while (nWritten < sContent.size()) {
      ssize_t iRet = ::write(iFd, sContent.data() + nWritten, sContent.size() - nWritten);
      if (iRet == -1) {
        if (errno == EINTR) continue;
        int iErr = errno;
        ::close(iFd);
        ::unlink(_sPath.c_str());
        throw std::system_error(iErr, std::generic_category(), "write failed");
      }
      nWritten += static_cast<size_t>(iRet);
    }
    ::fchmod(iFd, S_IRUSR | S_IWUSR);
    ::close(iFd);
  }

  ~ScopedTempFile() { ::unlink(_sPath.c_str()); }

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;

  const std::string& path() const { return _sPath; }

 private:
  std::string _sPath;
};

std::string attr(const common::ResourceDescriptor& rd, const char* pKey) {
  auto it = rd.jAttributes.find(pKey);
  if (it == rd.jAttributes.end() || it->is_null()) return {};
  if (it->is_string()) return it->get<std::string>();
  return it->dump();
}

std::string joinStrings(const nlohmann::json& jArray, const char* pSep) {
  std::string sOut;
  if (!jArray.is_array()) return sOut;
  for (const auto& jItem : jArray) {
    if (!sOut.empty()) sOut += pSep;
    sOut += jItem.get<std::string>();
  }
  return sOut;
}

std::string displayNameFilter(const std::string& sName) {
  return "--filter=displayName=\"" + sName + "\"";
}

std::string excerpt(const std::string& sText) {
  std::string sOut = sText.substr(0, 400);
  while (!sOut.empty() && (sOut.back() == '\n' || sOut.back() == ' ')) sOut.pop_back();
  return sOut;
}

common::CreateResult fromCommand(const common::CommandResult& cmr) {
  common::CreateResult cr;
  cr.bSuccess = cmr.ok();
  if (!cr.bSuccess) {
    cr.sErrorMessage = "exit " + std::to_string(cmr.iExitCode) + ": " + excerpt(cmr.sStderr);
  }
  return cr;
}

}  // namespace

GcloudClient::GcloudClient(IProcessRunner& prRunner, std::string sProjectId)
    : _gcCli(prRunner, std::move(sProjectId)), _gsmSecrets(_gcCli) {}

GcloudClient::~GcloudClient() = default;

std::string GcloudClient::name() const { return "gcloud"; }

ISecretManager& GcloudClient::secrets() { return _gsmSecrets; }

// ── Ambient prerequisites ──────────────────────────────────────────────────

bool GcloudClient::isInstalled() {
  try {
    return _gcCli.exec({"version"}).ok();
  } catch (const std::system_error& ex) {
    common::Logger::get()->debug("gcloud could not be started: {}", ex.what());
    return false;
  }
}

std::string GcloudClient::activeAccount() {
  auto cmr = _gcCli.exec({"auth", "list", "--filter=status:ACTIVE", "--format=value(account)"});
  return cmr.ok() ? GcloudCli::firstLine(cmr.sStdout) : std::string{};
}

std::string GcloudClient::activeProject() {
  auto cmr = _gcCli.exec({"config", "get-value", "project"});
  if (!cmr.ok()) return {};
  std::string sProject = GcloudCli::firstLine(cmr.sStdout);
  return sProject == "(unset)" ? std::string{} : sProject;
}

std::vector<std::string> GcloudClient::enabledServices() {
  std::vector<std::string> vServices;
  auto jList = _gcCli.execJson({"services", "list", "--enabled"});
  for (const auto& jService : jList) {
    if (jService.contains("config") && jService["config"].contains("name")) {
      vServices.push_back(jService["config"]["name"].get<std::string>());
    } else if (jService.contains("name")) {
      vServices.push_back(GcloudCli::basename(jService["name"].get<std::string>()));
    }
  }
  return vServices;
}

bool GcloudClient::enableService(const std::string& sService) {
  return _gcCli.exec({"services", "enable", sService}).ok();
}

// ── Resource lifecycle ─────────────────────────────────────────────────────

std::vector<std::string> GcloudClient::describeArgs(
    const common::ResourceDescriptor& rd) const {
  switch (rd.kind) {
    case ResourceKind::Network:
      return {"compute", "networks", "describe", rd.sName};
    case ResourceKind::Subnet:
      return {"compute", "networks", "subnets", "describe", rd.sName, "--region=" + rd.sLocation};
    case ResourceKind::FirewallRule:
      return {"compute", "firewall-rules", "describe", rd.sName};
    case ResourceKind::ServiceAccount:
      return {"iam", "service-accounts", "describe", attr(rd, "email")};
    case ResourceKind::Disk:
      return {"compute", "disks", "describe", rd.sName, "--zone=" + rd.sLocation};
    case ResourceKind::Instance:
      return {"compute", "instances", "describe", rd.sName, "--zone=" + rd.sLocation};
    case ResourceKind::LogMetric:
      return {"logging", "metrics", "describe", rd.sName};
    default:
      throw std::logic_error("describeArgs: kind is not addressed by name");
  }
}

std::vector<std::string> GcloudClient::deleteArgs(const common::ResourceDescriptor& rd) const {
  auto vArgs = describeArgs(rd);
  for (auto& sArg : vArgs) {
    if (sArg == "describe") {
      sArg = "delete";
      break;
    }
  }
  return vArgs;
}

std::vector<std::string> GcloudClient::findByDisplayName(const common::ResourceDescriptor& rd) {
  std::vector<std::string> vArgs;
  switch (rd.kind) {
    case ResourceKind::UptimeCheck:
      vArgs = {"monitoring", "uptime", "list-configs", displayNameFilter(rd.sName)};
      break;
    case ResourceKind::AlertPolicy:
      vArgs = {"alpha", "monitoring", "policies", "list", displayNameFilter(rd.sName)};
      break;
    case ResourceKind::Dashboard:
      vArgs = {"monitoring", "dashboards", "list", displayNameFilter(rd.sName)};
      break;
    case ResourceKind::Budget: {
      auto oAccount = billingAccount();
      if (!oAccount) return {};
      vArgs = {"billing", "budgets", "list", "--billing-account=" + *oAccount,
               displayNameFilter(rd.sName)};
      break;
    }
    default:
      throw std::logic_error("findByDisplayName: kind is addressed by name");
  }

  std::vector<std::string> vNames;
  for (const auto& jItem : _gcCli.execJson(vArgs)) {
    if (jItem.contains("name")) {
      vNames.push_back(jItem["name"].get<std::string>());
    }
  }
  return vNames;
}

bool GcloudClient::exists(const common::ResourceDescriptor& rd) {
  switch (rd.kind) {
    case ResourceKind::Secret:
      return _gsmSecrets.exists(rd.sName);
    case ResourceKind::UptimeCheck:
    case ResourceKind::AlertPolicy:
    case ResourceKind::Dashboard:
    case ResourceKind::Budget:
      return !findByDisplayName(rd).empty();
    default: {
      auto vArgs = describeArgs(rd);
      vArgs.emplace_back("--format=json");
      return _gcCli.execExists(rd.sName, vArgs);
    }
  }
}

common::CreateResult GcloudClient::create(const common::ResourceDescriptor& rd) {
  switch (rd.kind) {
    case ResourceKind::Network:
      return fromCommand(_gcCli.exec({"compute", "networks", "create", rd.sName,
                                      "--subnet-mode=custom",
                                      "--description=" + attr(rd, "description")}));
    case ResourceKind::Subnet:
      return fromCommand(_gcCli.exec({"compute", "networks", "subnets", "create", rd.sName,
                                      "--network=" + attr(rd, "network"),
                                      "--range=" + attr(rd, "range"),
                                      "--region=" + rd.sLocation}));
    case ResourceKind::FirewallRule:
      return fromCommand(_gcCli.exec({"compute", "firewall-rules", "create", rd.sName,
                                      "--network=" + attr(rd, "network"), "--action=ALLOW",
                                      "--rules=" + attr(rd, "rules"),
                                      "--source-ranges=" + attr(rd, "sourceRanges"),
                                      "--target-tags=" + attr(rd, "targetTag"),
                                      "--description=" + attr(rd, "description")}));
    case ResourceKind::ServiceAccount: {
      auto cr = fromCommand(_gcCli.exec({"iam", "service-accounts", "create", rd.sName,
                                         "--display-name=" + attr(rd, "displayName")}));
      if (cr.bSuccess) cr.mAttributes["email"] = attr(rd, "email");
      return cr;
    }
    case ResourceKind::Disk:
      return fromCommand(_gcCli.exec({"compute", "disks", "create", rd.sName,
                                      "--zone=" + rd.sLocation,
                                      "--size=" + attr(rd, "sizeGb") + "GB",
                                      "--type=" + attr(rd, "type"),
                                      "--image-family=" + attr(rd, "imageFamily"),
                                      "--image-project=" + attr(rd, "imageProject")}));
    case ResourceKind::Instance:
      return createInstance(rd);
    case ResourceKind::Secret: {
      common::CreateResult cr;
      cr.bSuccess = _gsmSecrets.create(rd.sName);
      if (!cr.bSuccess) cr.sErrorMessage = "secrets create failed";
      return cr;
    }
    case ResourceKind::UptimeCheck:
      return fromCommand(_gcCli.exec(
          {"monitoring", "uptime", "create", rd.sName, "--resource-type=uptime-url",
           "--resource-labels=host=" + attr(rd, "host") + ",project_id=" + _gcCli.projectId(),
           "--protocol=https", "--port=443", "--path=" + attr(rd, "path")}));
    case ResourceKind::AlertPolicy:
    case ResourceKind::Dashboard:
      return createFromFile(rd);
    case ResourceKind::LogMetric:
      return fromCommand(_gcCli.exec({"logging", "metrics", "create", rd.sName,
                                      "--description=" + attr(rd, "description"),
                                      "--log-filter=" + attr(rd, "filter")}));
    case ResourceKind::Budget:
      return createBudget(rd);
  }
  throw std::logic_error("create: unhandled resource kind");
}

common::CreateResult GcloudClient::createInstance(const common::ResourceDescriptor& rd) {
  ScopedTempFile tfScript(attr(rd, "startupScript"));

  std::vector<std::string> vArgs = {
      "compute", "instances", "create", rd.sName,
      "--zone=" + rd.sLocation,
      "--machine-type=" + attr(rd, "machineType"),
      "--network-interface=subnet=" + attr(rd, "subnet") +
          ",private-network-ip=" + attr(rd, "privateIp"),
      "--disk=name=" + attr(rd, "disk") + ",boot=yes,auto-delete=yes",
      "--service-account=" + attr(rd, "serviceAccount"),
      std::string("--scopes=") + kCloudPlatformScope,
      "--tags=" + joinStrings(rd.jAttributes.value("tags", nlohmann::json::array()), ","),
      "--metadata-from-file=startup-script=" + tfScript.path(),
      "--maintenance-policy=MIGRATE"};

  nlohmann::json jCreated;
  try {
    jCreated = _gcCli.execJson(vArgs);
  } catch (const common::CloudCommandError& ex) {
    common::CreateResult cr;
    cr.sErrorMessage = ex.what();
    return cr;
  }

  common::CreateResult cr;
  cr.bSuccess = true;
  const nlohmann::json& jInstance =
      (jCreated.is_array() && !jCreated.empty()) ? jCreated.front() : jCreated;
  if (jInstance.is_object()) {
    auto ii = parseInstance(jInstance);
    cr.mAttributes["internalIp"] = ii.sInternalIp;
    cr.mAttributes["externalIp"] = ii.sExternalIp;
    cr.mAttributes["status"] = ii.sStatus;
  }
  return cr;
}

common::CreateResult GcloudClient::createFromFile(const common::ResourceDescriptor& rd) {
  const bool bPolicy = rd.kind == ResourceKind::AlertPolicy;
  auto itPayload = rd.jAttributes.find(bPolicy ? "policy" : "dashboard");
  if (itPayload == rd.jAttributes.end()) {
    common::CreateResult cr;
    cr.sErrorMessage = "descriptor has no payload";
    return cr;
  }

  ScopedTempFile tfPayload(itPayload->dump(2));
  if (bPolicy) {
    return fromCommand(_gcCli.exec({"alpha", "monitoring", "policies", "create",
                                    "--policy-from-file=" + tfPayload.path()}));
  }
  return fromCommand(_gcCli.exec(
      {"monitoring", "dashboards", "create", "--config-from-file=" + tfPayload.path()}));
}

common::CreateResult GcloudClient::createBudget(const common::ResourceDescriptor& rd) {
  auto oAccount = billingAccount();
  if (!oAccount) {
    common::CreateResult cr;
    cr.sErrorMessage = "no billing account linked to project " + _gcCli.projectId();
    return cr;
  }

  std::vector<std::string> vArgs = {"billing", "budgets", "create",
                                    "--billing-account=" + *oAccount,
                                    "--display-name=" + rd.sName,
                                    "--budget-amount=" + attr(rd, "amountUsd") + "USD",
                                    "--filter-projects=projects/" + _gcCli.projectId()};
  for (const auto& jThreshold : rd.jAttributes.value("thresholds", nlohmann::json::array())) {
    vArgs.push_back("--threshold-rule=percent=" + jThreshold.dump());
  }
  return fromCommand(_gcCli.exec(vArgs));
}

bool GcloudClient::remove(const common::ResourceDescriptor& rd) {
  switch (rd.kind) {
    case ResourceKind::Secret:
      return _gsmSecrets.remove(rd.sName);
    case ResourceKind::UptimeCheck:
    case ResourceKind::AlertPolicy:
    case ResourceKind::Dashboard:
    case ResourceKind::Budget: {
      const auto vNames = findByDisplayName(rd);
      const auto oAccount = rd.kind == ResourceKind::Budget ? billingAccount() : std::nullopt;
      bool bAllDeleted = true;
      for (const auto& sName : vNames) {
        std::vector<std::string> vArgs;
        if (rd.kind == ResourceKind::UptimeCheck) {
          vArgs = {"monitoring", "uptime", "delete", GcloudCli::basename(sName)};
        } else if (rd.kind == ResourceKind::AlertPolicy) {
          vArgs = {"alpha", "monitoring", "policies", "delete", sName};
        } else if (rd.kind == ResourceKind::Dashboard) {
          vArgs = {"monitoring", "dashboards", "delete", GcloudCli::basename(sName)};
        } else {
          vArgs = {"billing", "budgets", "delete", GcloudCli::basename(sName),
                   "--billing-account=" + oAccount.value_or("")};
        }
        bAllDeleted = _gcCli.exec(vArgs).ok() && bAllDeleted;
      }
      return bAllDeleted;
    }
    default:
      return _gcCli.exec(deleteArgs(rd)).ok();
  }
}

// ── Inventory ──────────────────────────────────────────────────────────────

common::InstanceInfo GcloudClient::parseInstance(const nlohmann::json& jInstance) {
  common::InstanceInfo ii;
  ii.sName = jInstance.value("name", "");
  ii.sZone = GcloudCli::basename(jInstance.value("zone", ""));
  ii.sMachineType = GcloudCli::basename(jInstance.value("machineType", ""));
  ii.sStatus = jInstance.value("status", "");

  auto itNics = jInstance.find("networkInterfaces");
  if (itNics != jInstance.end() && itNics->is_array() && !itNics->empty()) {
    const auto& jNic = itNics->front();
    ii.sInternalIp = jNic.value("networkIP", "");
    auto itAccess = jNic.find("accessConfigs");
    if (itAccess != jNic.end() && itAccess->is_array() && !itAccess->empty()) {
      ii.sExternalIp = itAccess->front().value("natIP", "");
    }
  }
  return ii;
}

std::vector<common::InstanceInfo> GcloudClient::listInstances(const std::string& sMachineType) {
  std::vector<common::InstanceInfo> vInstances;
  for (const auto& jInstance :
       _gcCli.execJson({"compute", "instances", "list", "--filter=machineType:" + sMachineType})) {
    vInstances.push_back(parseInstance(jInstance));
  }
  return vInstances;
}

std::vector<common::DiskInfo> GcloudClient::listDisks(const std::string& sDiskType) {
  std::vector<common::DiskInfo> vDisks;
  for (const auto& jDisk :
       _gcCli.execJson({"compute", "disks", "list", "--filter=type:" + sDiskType})) {
    common::DiskInfo di;
    di.sName = jDisk.value("name", "");
    di.sZone = GcloudCli::basename(jDisk.value("zone", ""));
    di.sType = GcloudCli::basename(jDisk.value("type", ""));
    // The compute API serializes int64 fields as strings
    const auto& jSize = jDisk.contains("sizeGb") ? jDisk["sizeGb"] : nlohmann::json(0);
    try {
      di.iSizeGb = jSize.is_string() ? std::stoll(jSize.get<std::string>())
                                     : jSize.get<int64_t>();
    } catch (const std::exception&) {
      throw common::CloudCommandError("gcloud_bad_output",
                                      "Disk " + di.sName + " has invalid sizeGb " + jSize.dump());
    }
    vDisks.push_back(std::move(di));
  }
  return vDisks;
}

std::vector<std::string> GcloudClient::listStaticAddresses() {
  std::vector<std::string> vAddresses;
  for (const auto& jAddress : _gcCli.execJson({"compute", "addresses", "list"})) {
    vAddresses.push_back(jAddress.value("name", ""));
  }
  return vAddresses;
}

std::optional<std::string> GcloudClient::billingAccount() {
  auto cmr = _gcCli.exec({"billing", "projects", "describe", _gcCli.projectId(),
                          "--format=value(billingAccountName)"});
  if (!cmr.ok()) return std::nullopt;
  std::string sAccount = GcloudCli::basename(GcloudCli::firstLine(cmr.sStdout));
  if (sAccount.empty()) return std::nullopt;
  return sAccount;
}

bool GcloudClient::grantProjectRole(const std::string& sMember, const std::string& sRole) {
  return _gcCli
      .exec({"projects", "add-iam-policy-binding", _gcCli.projectId(), "--member=" + sMember,
             "--role=" + sRole, "--condition=None"})
      .ok();
}

// ── Instance operations ────────────────────────────────────────────────────

std::optional<common::InstanceInfo> GcloudClient::describeInstance(const std::string& sName,
                                                                   const std::string& sZone) {
  auto cmr = _gcCli.exec(
      {"compute", "instances", "describe", sName, "--zone=" + sZone, "--format=json"});
  if (!cmr.ok()) return std::nullopt;
  try {
    return parseInstance(nlohmann::json::parse(cmr.sStdout));
  } catch (const nlohmann::json::exception& ex) {
    throw common::CloudCommandError("gcloud_bad_output",
                                    "Unparseable instance description: " + std::string(ex.what()));
  }
}

bool GcloudClient::startInstance(const std::string& sName, const std::string& sZone) {
  return _gcCli.exec({"compute", "instances", "start", sName, "--zone=" + sZone}).ok();
}

common::CommandResult GcloudClient::runRemote(const std::string& sInstance,
                                              const std::string& sZone,
                                              const std::string& sCommand) {
  return _gcCli.exec(
      {"compute", "ssh", sInstance, "--zone=" + sZone, "--command=" + sCommand});
}

common::CommandResult GcloudClient::copyToInstance(const std::string& sInstance,
                                                   const std::string& sZone,
                                                   const std::string& sLocalPath,
                                                   const std::string& sRemotePath) {
  return _gcCli.exec(
      {"compute", "scp", sLocalPath, sInstance + ":" + sRemotePath, "--zone=" + sZone});
}

}  // namespace cdp::cloud
