#include "core/ResourceCatalog.hpp"

#include "core/RemoteScripts.hpp"
#include "core/ResourceNaming.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace cdp::core {

using common::ResourceDescriptor;
using common::ResourceKind;
using common::ResourceScope;
using nlohmann::json;

namespace {

struct FirewallSpec {
  const char* pQualifier;
  const char* pRules;
  const char* pDescription;
};

constexpr FirewallSpec kFirewallSpecs[] = {
    {"http", "tcp:80", "Allow HTTP for the ACME challenge and redirect"},
    {"https", "tcp:443", "Allow HTTPS to the reverse proxy"},
    {"ssh", "tcp:22", "Allow SSH for remote administration"},
};

ResourceDescriptor makeDescriptor(ResourceKind kind, std::string sName, ResourceScope scope,
                                  std::string sLocation, json jAttributes,
                                  bool bOptional = false) {
  ResourceDescriptor rd;
  rd.kind = kind;
  rd.sName = std::move(sName);
  rd.scope = scope;
  rd.sLocation = std::move(sLocation);
  rd.jAttributes = std::move(jAttributes);
  rd.bOptional = bOptional;
  return rd;
}

}  // namespace

ResourceCatalog::ResourceCatalog(const common::Config& cfg)
    : _cfg(cfg), _sPrefix(cfg.resourcePrefix()) {}

ResourceCatalog::~ResourceCatalog() = default;

std::string ResourceCatalog::networkTag(const std::string& sQualifier) const {
  return resourceName(ResourceKind::FirewallRule, _cfg.sAppName, sQualifier);
}

// ── Networking ─────────────────────────────────────────────────────────────

ResourceDescriptor ResourceCatalog::network() const {
  return makeDescriptor(ResourceKind::Network, resourceName(ResourceKind::Network, _sPrefix),
                        ResourceScope::Global, "",
                        {{"description", "VPC for " + _cfg.sAppName}});
}

ResourceDescriptor ResourceCatalog::subnet() const {
  return makeDescriptor(ResourceKind::Subnet, resourceName(ResourceKind::Subnet, _sPrefix),
                        ResourceScope::Region, _cfg.sRegion,
                        {{"network", network().sName}, {"range", kSubnetRange}});
}

std::vector<ResourceDescriptor> ResourceCatalog::firewallRules() const {
  std::vector<ResourceDescriptor> vRules;
  for (const auto& fs : kFirewallSpecs) {
    vRules.push_back(makeDescriptor(
        ResourceKind::FirewallRule,
        resourceName(ResourceKind::FirewallRule, _sPrefix, fs.pQualifier), ResourceScope::Global,
        "",
        {{"network", network().sName},
         {"rules", fs.pRules},
         {"sourceRanges", "0.0.0.0/0"},
         {"targetTag", networkTag(fs.pQualifier)},
         {"description", fs.pDescription}}));
  }
  return vRules;
}

// ── Identity ───────────────────────────────────────────────────────────────

std::string ResourceCatalog::serviceAccountEmail() const {
  return resourceName(ResourceKind::ServiceAccount, _sPrefix) + "@" + _cfg.sProjectId +
         ".iam.gserviceaccount.com";
}

std::string ResourceCatalog::serviceAccountMember() const {
  return "serviceAccount:" + serviceAccountEmail();
}

ResourceDescriptor ResourceCatalog::serviceAccount() const {
  return makeDescriptor(ResourceKind::ServiceAccount,
                        resourceName(ResourceKind::ServiceAccount, _sPrefix),
                        ResourceScope::Global, "",
                        {{"email", serviceAccountEmail()},
                         {"displayName", _cfg.sAppName + " service account"}});
}

// ── Compute ────────────────────────────────────────────────────────────────

ResourceDescriptor ResourceCatalog::disk() const {
  return makeDescriptor(ResourceKind::Disk, resourceName(ResourceKind::Disk, _sPrefix),
                        ResourceScope::Zone, _cfg.sZone,
                        {{"sizeGb", std::to_string(_cfg.iDiskSizeGb)},
                         {"type", _cfg.sDiskType},
                         {"imageFamily", _cfg.sImageFamily},
                         {"imageProject", _cfg.sImageProject}});
}

ResourceDescriptor ResourceCatalog::instance() const {
  json jTags = json::array();
  for (const auto& fs : kFirewallSpecs) jTags.push_back(networkTag(fs.pQualifier));

  return makeDescriptor(ResourceKind::Instance, resourceName(ResourceKind::Instance, _sPrefix),
                        ResourceScope::Zone, _cfg.sZone,
                        {{"machineType", _cfg.sMachineType},
                         {"subnet", subnet().sName},
                         {"privateIp", kInstancePrivateIp},
                         {"disk", disk().sName},
                         {"serviceAccount", serviceAccountEmail()},
                         {"tags", jTags},
                         {"startupScript", remote::startupScript(_cfg)}});
}

// ── Secrets ────────────────────────────────────────────────────────────────

std::string ResourceCatalog::apiKeySecretName() const {
  if (!_cfg.sApiKeySecretName.empty()) return _cfg.sApiKeySecretName;
  return resourceName(ResourceKind::Secret, _sPrefix);
}

ResourceDescriptor ResourceCatalog::apiKeySecret() const {
  return makeDescriptor(ResourceKind::Secret, apiKeySecretName(), ResourceScope::Global, "",
                        json::object());
}

// ── Monitoring and billing ─────────────────────────────────────────────────

ResourceDescriptor ResourceCatalog::budget() const {
  return makeDescriptor(ResourceKind::Budget, resourceName(ResourceKind::Budget, _sPrefix),
                        ResourceScope::Global, "",
                        {{"amountUsd", std::to_string(_cfg.iBudgetAmountUsd)},
                         {"thresholds", json::array({0.5, 0.9, 1.0})}},
                        true);
}

ResourceDescriptor ResourceCatalog::uptimeCheck(const std::string& sHost) const {
  return makeDescriptor(ResourceKind::UptimeCheck,
                        resourceName(ResourceKind::UptimeCheck, _sPrefix), ResourceScope::Global,
                        "", {{"host", sHost}, {"path", "/health"}}, true);
}

std::vector<ResourceDescriptor> ResourceCatalog::alertPolicies() const {
  const std::string sDownName = resourceName(ResourceKind::AlertPolicy, _sPrefix, "instance-down");
  const std::string sMemoryName =
      resourceName(ResourceKind::AlertPolicy, _sPrefix, "high-memory");

  json jDown = {
      {"displayName", sDownName},
      {"combiner", "OR"},
      {"enabled", true},
      {"conditions",
       {{{"displayName", "Uptime check failure"},
         {"conditionThreshold",
          {{"filter",
            "resource.type=\"uptime_url\" AND "
            "metric.type=\"monitoring.googleapis.com/uptime_check/check_passed\""},
           {"comparison", "COMPARISON_LT"},
           {"thresholdValue", 1},
           {"duration", "300s"},
           {"aggregations",
            {{{"alignmentPeriod", "300s"},
              {"perSeriesAligner", "ALIGN_FRACTION_TRUE"},
              {"crossSeriesReducer", "REDUCE_MEAN"},
              {"groupByFields", {"resource.label.host"}}}}}}}}}}};

  json jMemory = {
      {"displayName", sMemoryName},
      {"combiner", "OR"},
      {"enabled", true},
      {"conditions",
       {{{"displayName", "Memory usage over 90%"},
         {"conditionThreshold",
          {{"filter",
            "resource.type=\"gce_instance\" AND "
            "metric.type=\"agent.googleapis.com/memory/percent_used\" AND "
            "metric.label.state=\"used\""},
           {"comparison", "COMPARISON_GT"},
           {"thresholdValue", 90},
           {"duration", "900s"},
           {"aggregations",
            {{{"alignmentPeriod", "300s"}, {"perSeriesAligner", "ALIGN_MEAN"}}}}}}}}}};

  return {
      makeDescriptor(ResourceKind::AlertPolicy, sDownName, ResourceScope::Global, "",
                     {{"policy", jDown}}, true),
      makeDescriptor(ResourceKind::AlertPolicy, sMemoryName, ResourceScope::Global, "",
                     {{"policy", jMemory}}, true),
  };
}

ResourceDescriptor ResourceCatalog::dashboard() const {
  const std::string sName = resourceName(ResourceKind::Dashboard, _sPrefix);

  auto chart = [](const std::string& sTitle, const std::string& sMetric) {
    return json{
        {"title", sTitle},
        {"xyChart",
         {{"dataSets",
           {{{"timeSeriesQuery",
              {{"timeSeriesFilter",
                {{"filter", "resource.type=\"gce_instance\" AND metric.type=\"" + sMetric + "\""},
                 {"aggregation",
                  {{"alignmentPeriod", "60s"}, {"perSeriesAligner", "ALIGN_MEAN"}}}}}}}}}}}}};
  };

  json jDashboard = {
      {"displayName", sName},
      {"gridLayout",
       {{"columns", "2"},
        {"widgets",
         {chart("CPU utilization", "compute.googleapis.com/instance/cpu/utilization"),
          chart("Memory used (%)", "agent.googleapis.com/memory/percent_used"),
          chart("Network received bytes",
                "compute.googleapis.com/instance/network/received_bytes_count"),
          chart("Disk used (%)", "agent.googleapis.com/disk/percent_used")}}}}};

  return makeDescriptor(ResourceKind::Dashboard, sName, ResourceScope::Global, "",
                        {{"dashboard", jDashboard}}, true);
}

std::vector<ResourceDescriptor> ResourceCatalog::logMetrics() const {
  const std::string sServiceFilter =
      "resource.type=\"gce_instance\" AND jsonPayload.service=\"" + _cfg.sAppName + "\"";
  return {
      makeDescriptor(ResourceKind::LogMetric,
                     resourceName(ResourceKind::LogMetric, _sPrefix, "error-rate"),
                     ResourceScope::Global, "",
                     {{"description", _cfg.sAppName + " error log entries"},
                      {"filter", sServiceFilter + " AND severity>=ERROR"}},
                     true),
      makeDescriptor(ResourceKind::LogMetric,
                     resourceName(ResourceKind::LogMetric, _sPrefix, "requests"),
                     ResourceScope::Global, "",
                     {{"description", _cfg.sAppName + " request log entries"},
                      {"filter", sServiceFilter + " AND jsonPayload.msg=~\"request\""}},
                     true),
  };
}

// ── Ordered sets ───────────────────────────────────────────────────────────

std::vector<ResourceDescriptor> ResourceCatalog::infrastructure() const {
  std::vector<ResourceDescriptor> vOut = {network(), subnet()};
  for (auto& rd : firewallRules()) vOut.push_back(std::move(rd));
  vOut.push_back(serviceAccount());
  vOut.push_back(disk());
  vOut.push_back(instance());
  return vOut;
}

std::vector<ResourceDescriptor> ResourceCatalog::monitoring(const std::string& sHost) const {
  std::vector<ResourceDescriptor> vOut;
  if (!sHost.empty()) vOut.push_back(uptimeCheck(sHost));
  for (auto& rd : alertPolicies()) vOut.push_back(std::move(rd));
  vOut.push_back(dashboard());
  for (auto& rd : logMetrics()) vOut.push_back(std::move(rd));
  return vOut;
}

std::vector<ResourceDescriptor> ResourceCatalog::deletionOrder() const {
  std::vector<ResourceDescriptor> vOut = {instance(), disk()};
  for (auto& rd : firewallRules()) vOut.push_back(std::move(rd));
  vOut.push_back(subnet());
  vOut.push_back(network());
  vOut.push_back(serviceAccount());
  vOut.push_back(apiKeySecret());
  vOut.push_back(uptimeCheck(""));
  for (auto& rd : alertPolicies()) vOut.push_back(std::move(rd));
  vOut.push_back(dashboard());
  for (auto& rd : logMetrics()) vOut.push_back(std::move(rd));
  vOut.push_back(budget());
  return vOut;
}

}  // namespace cdp::core
