#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cdp::common {

/// Every resource class the reconciler can create.
enum class ResourceKind {
  Network,
  Subnet,
  FirewallRule,
  ServiceAccount,
  Disk,
  Instance,
  Secret,
  UptimeCheck,
  AlertPolicy,
  Dashboard,
  LogMetric,
  Budget,
};

/// Where a resource lives. Region/zone scoped resources carry sLocation.
enum class ResourceScope { Global, Region, Zone };

/// Stateless definition of one named cloud resource.
/// Existence, create and delete are dispatched on kind by ICloudClient.
/// Class abbreviation: rd
struct ResourceDescriptor {
  ResourceKind kind = ResourceKind::Network;
  std::string sName;
  ResourceScope scope = ResourceScope::Global;
  std::string sLocation;
  nlohmann::json jAttributes = nlohmann::json::object();
  bool bOptional = false;  // create failure is a warning, not an abort
};

/// Result of a create action.
/// Class abbreviation: cr
struct CreateResult {
  bool bSuccess = false;
  std::map<std::string, std::string> mAttributes;
  std::string sErrorMessage;
};

/// Outcome of one reconciliation.
enum class ReconcileStatus { Created, AlreadyExists, Failed };

/// Class abbreviation: ro
struct ReconcileOutcome {
  ResourceKind kind = ResourceKind::Network;
  std::string sName;
  ReconcileStatus status = ReconcileStatus::Failed;
  std::string sReason;
  std::map<std::string, std::string> mAttributes;
};

/// Captured result of a child process or remote command.
/// Class abbreviation: cmr
struct CommandResult {
  int iExitCode = -1;
  std::string sStdout;
  std::string sStderr;

  bool ok() const { return iExitCode == 0; }
};

/// Compute instance as reported by the control plane.
/// Class abbreviation: ii
struct InstanceInfo {
  std::string sName;
  std::string sZone;
  std::string sMachineType;
  std::string sStatus;
  std::string sInternalIp;
  std::string sExternalIp;
};

/// Persistent disk as reported by the control plane.
struct DiskInfo {
  std::string sName;
  std::string sZone;
  std::string sType;
  int64_t iSizeGb = 0;
};

/// Non-fatal diagnostic accumulated by cleanup and informational checks.
/// Never thrown.
struct BestEffortWarning {
  std::string sSource;
  std::string sMessage;
};

}  // namespace cdp::common
