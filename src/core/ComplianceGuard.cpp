#include "core/ComplianceGuard.hpp"

#include "common/Logger.hpp"
#include "core/ResourceCatalog.hpp"

#include <algorithm>
#include <cstdint>
#include <utility>

namespace cdp::core {

namespace {

std::string joinNames(const std::vector<std::string>& vNames) {
  std::string sOut;
  for (const auto& s : vNames) {
    if (!sOut.empty()) sOut += ", ";
    sOut += s;
  }
  return sOut;
}

std::vector<ComplianceRule> freeTierRules() {
  std::vector<ComplianceRule> vRules;

  vRules.push_back({"region-allowed", Severity::Hard, false,
                    [](const common::Config& cfg, const LiveCloudState&)
                        -> std::optional<std::string> {
                      const auto& vAllowed = ComplianceGuard::allowedRegions();
                      if (std::find(vAllowed.begin(), vAllowed.end(), cfg.sRegion) !=
                          vAllowed.end()) {
                        return std::nullopt;
                      }
                      return "Region " + cfg.sRegion + " is not free-tier eligible (allowed: " +
                             joinNames(vAllowed) + ")";
                    }});

  vRules.push_back({"zone-in-region", Severity::Hard, false,
                    [](const common::Config& cfg, const LiveCloudState&)
                        -> std::optional<std::string> {
                      const std::string sExpected = cfg.sRegion + "-";
                      if (cfg.sZone.size() > sExpected.size() &&
                          cfg.sZone.compare(0, sExpected.size(), sExpected) == 0) {
                        return std::nullopt;
                      }
                      return "Zone " + cfg.sZone + " is not in region " + cfg.sRegion;
                    }});

  vRules.push_back({"machine-type", Severity::Hard, true,
                    [](const common::Config& cfg, const LiveCloudState&)
                        -> std::optional<std::string> {
                      if (cfg.sMachineType == ComplianceGuard::kMinimalMachineType) {
                        return std::nullopt;
                      }
                      return "Machine type " + cfg.sMachineType + " is not free-tier (" +
                             ComplianceGuard::kMinimalMachineType + ")";
                    }});

  vRules.push_back({"disk-size", Severity::Hard, true,
                    [](const common::Config& cfg, const LiveCloudState&)
                        -> std::optional<std::string> {
                      if (cfg.iDiskSizeGb <= ComplianceGuard::kStorageCeilingGb) {
                        return std::nullopt;
                      }
                      return "Disk size " + std::to_string(cfg.iDiskSizeGb) +
                             " GB exceeds the " +
                             std::to_string(ComplianceGuard::kStorageCeilingGb) + " GB ceiling";
                    }});

  vRules.push_back({"minimal-instance-quota", Severity::Hard, true,
                    [](const common::Config&, const LiveCloudState& lcs)
                        -> std::optional<std::string> {
                      std::vector<std::string> vOthers;
                      for (const auto& ii : lcs.vMinimalTierInstances) {
                        if (ii.sName != lcs.sOwnInstanceName) {
                          vOthers.push_back(ii.sName + " (" + ii.sZone + ")");
                        }
                      }
                      if (vOthers.empty()) return std::nullopt;
                      return std::to_string(vOthers.size()) + " " +
                             ComplianceGuard::kMinimalMachineType +
                             " instance(s) already exist: " + joinNames(vOthers);
                    }});

  vRules.push_back({"standard-storage-quota", Severity::Hard, false,
                    [](const common::Config& cfg, const LiveCloudState& lcs)
                        -> std::optional<std::string> {
                      int64_t iExisting = 0;
                      for (const auto& di : lcs.vStandardDisks) {
                        if (di.sName != lcs.sOwnDiskName) iExisting += di.iSizeGb;
                      }
                      const int64_t iTotal = iExisting + cfg.iDiskSizeGb;
                      if (iTotal <= ComplianceGuard::kStorageCeilingGb) return std::nullopt;
                      return "Standard persistent disk would total " + std::to_string(iTotal) +
                             " GB (" + std::to_string(iExisting) + " GB existing + " +
                             std::to_string(cfg.iDiskSizeGb) + " GB requested), ceiling is " +
                             std::to_string(ComplianceGuard::kStorageCeilingGb) + " GB";
                    }});

  vRules.push_back({"no-static-addresses", Severity::Warn, false,
                    [](const common::Config&, const LiveCloudState& lcs)
                        -> std::optional<std::string> {
                      if (lcs.vStaticAddresses.empty()) return std::nullopt;
                      return "Reserved static addresses are billed: " +
                             joinNames(lcs.vStaticAddresses);
                    }});

  vRules.push_back({"billing-account-linked", Severity::Warn, false,
                    [](const common::Config& cfg, const LiveCloudState& lcs)
                        -> std::optional<std::string> {
                      if (lcs.oBillingAccount) return std::nullopt;
                      return "No billing account linked to " + cfg.sProjectId +
                             "; budget alerts are unavailable";
                    }});

  return vRules;
}

}  // namespace

ComplianceGuard::ComplianceGuard() : _vRules(freeTierRules()) {}
ComplianceGuard::~ComplianceGuard() = default;

const std::vector<std::string>& ComplianceGuard::allowedRegions() {
  static const std::vector<std::string> vRegions = {"us-central1", "us-east1", "us-west1"};
  return vRegions;
}

void ComplianceGuard::addRule(ComplianceRule crRule) { _vRules.push_back(std::move(crRule)); }

LiveCloudState ComplianceGuard::snapshot(cloud::ICloudClient& icClient,
                                         const common::Config& cfg,
                                         const ResourceCatalog& rcCatalog) {
  LiveCloudState lcs;
  lcs.vMinimalTierInstances = icClient.listInstances(kMinimalMachineType);
  lcs.vStandardDisks = icClient.listDisks(kStandardDiskType);
  lcs.vStaticAddresses = icClient.listStaticAddresses();
  lcs.oBillingAccount = icClient.billingAccount();
  lcs.sOwnInstanceName = rcCatalog.instance().sName;
  lcs.sOwnDiskName = rcCatalog.disk().sName;

  common::Logger::get()->debug(
      "Compliance snapshot for {}: {} {} instance(s), {} {} disk(s), {} static address(es)",
      cfg.sProjectId, lcs.vMinimalTierInstances.size(), kMinimalMachineType,
      lcs.vStandardDisks.size(), kStandardDiskType, lcs.vStaticAddresses.size());
  return lcs;
}

std::vector<RuleResult> ComplianceGuard::evaluate(const common::Config& cfg,
                                                  const LiveCloudState& lcsState) const {
  std::vector<RuleResult> vResults;
  vResults.reserve(_vRules.size());
  for (const auto& crRule : _vRules) {
    RuleResult rr;
    rr.sRule = crRule.sName;
    rr.severity =
        (crRule.bOverridable && cfg.bForce) ? Severity::Warn : crRule.severity;

    auto oViolation = crRule.fnViolation(cfg, lcsState);
    rr.bPassed = !oViolation.has_value();
    if (oViolation) {
      rr.sMessage = *oViolation;
      if (crRule.bOverridable && cfg.bForce) rr.sMessage += " (overridden by --force)";
    } else {
      rr.sMessage = "ok";
    }
    vResults.push_back(std::move(rr));
  }
  return vResults;
}

bool ComplianceGuard::hasHardFailure(const std::vector<RuleResult>& vResults) {
  return std::any_of(vResults.begin(), vResults.end(), [](const RuleResult& rr) {
    return !rr.bPassed && rr.severity == Severity::Hard;
  });
}

void ComplianceGuard::logResults(const std::vector<RuleResult>& vResults) {
  auto spLog = common::Logger::get();
  for (const auto& rr : vResults) {
    if (rr.bPassed) {
      spLog->info("[PASS] {}", rr.sRule);
    } else if (rr.severity == Severity::Hard) {
      spLog->error("[HARD] {}: {}", rr.sRule, rr.sMessage);
    } else {
      spLog->warn("[WARN] {}: {}", rr.sRule, rr.sMessage);
    }
  }
}

}  // namespace cdp::core
