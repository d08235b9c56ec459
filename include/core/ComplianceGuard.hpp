#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "cloud/ICloudClient.hpp"
#include "common/Config.hpp"
#include "common/Types.hpp"

namespace cdp::core {

class ResourceCatalog;

enum class Severity { Hard, Warn };

/// Read-only inventory the rules are evaluated against.
/// Class abbreviation: lcs
struct LiveCloudState {
  std::vector<common::InstanceInfo> vMinimalTierInstances;
  std::vector<common::DiskInfo> vStandardDisks;
  std::vector<std::string> vStaticAddresses;
  std::optional<std::string> oBillingAccount;

  // This deployment's own VM and disk, excluded from the quota rules
  std::string sOwnInstanceName;
  std::string sOwnDiskName;
};

/// Class abbreviation: rr
struct RuleResult {
  std::string sRule;
  Severity severity = Severity::Hard;
  bool bPassed = false;
  std::string sMessage;
};

/// A named predicate. fnViolation returns a message when the rule is broken.
/// bOverridable rules drop to Warn when the operator passes --force.
struct ComplianceRule {
  std::string sName;
  Severity severity = Severity::Hard;
  bool bOverridable = false;
  std::function<std::optional<std::string>(const common::Config&, const LiveCloudState&)>
      fnViolation;
};

/// Pre-flight cost and quota gate. Evaluated on every run, never cached.
/// Class abbreviation: cg
class ComplianceGuard {
 public:
  /// Guard loaded with the free-tier rule set.
  ComplianceGuard();
  ~ComplianceGuard();

  void addRule(ComplianceRule crRule);
  size_t ruleCount() const { return _vRules.size(); }

  /// Query the inventory the rules need. Inventory failures propagate as
  /// CloudCommandError; a missing billing account is recorded, not thrown.
  static LiveCloudState snapshot(cloud::ICloudClient& icClient, const common::Config& cfg,
                                 const ResourceCatalog& rcCatalog);

  /// Pure evaluation of every rule, in registration order.
  std::vector<RuleResult> evaluate(const common::Config& cfg,
                                   const LiveCloudState& lcsState) const;

  static bool hasHardFailure(const std::vector<RuleResult>& vResults);

  /// One log line per result.
  static void logResults(const std::vector<RuleResult>& vResults);

  static constexpr int kStorageCeilingGb = 30;
  static constexpr const char* kMinimalMachineType = "e2-micro";
  static constexpr const char* kStandardDiskType = "pd-standard";
  static const std::vector<std::string>& allowedRegions();

 private:
  std::vector<ComplianceRule> _vRules;
};

}  // namespace cdp::core
