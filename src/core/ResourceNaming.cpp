#include "core/ResourceNaming.hpp"

#include <cctype>
#include <stdexcept>

namespace cdp::core {

using common::ResourceKind;

namespace {

constexpr size_t kComputeNameLimit = 63;
constexpr size_t kServiceAccountIdLimit = 30;

/// Fixed part each kind appends to the prefix.
std::string kindSuffix(ResourceKind kind, const std::string& sQualifier) {
  switch (kind) {
    case ResourceKind::Network:        return "vpc";
    case ResourceKind::Subnet:         return "subnet";
    case ResourceKind::FirewallRule:   return "allow";
    case ResourceKind::ServiceAccount: return "sa";
    case ResourceKind::Disk:           return "disk";
    case ResourceKind::Instance:       return "vm";
    case ResourceKind::Secret:         return "api-key";
    case ResourceKind::UptimeCheck:    return "uptime";
    case ResourceKind::AlertPolicy:    return "alert";
    case ResourceKind::Dashboard:      return "dashboard";
    case ResourceKind::LogMetric:      return sQualifier.empty() ? "metric" : "";
    case ResourceKind::Budget:         return "budget";
  }
  throw std::logic_error("kindSuffix: unhandled resource kind");
}

/// Lowercase, map anything outside [a-z0-9] to '-', collapse and trim '-'.
std::string sanitize(const std::string& sRaw) {
  std::string sOut;
  sOut.reserve(sRaw.size());
  for (char c : sRaw) {
    auto uc = static_cast<unsigned char>(c);
    char cOut = std::isalnum(uc) ? static_cast<char>(std::tolower(uc)) : '-';
    if (cOut == '-' && (sOut.empty() || sOut.back() == '-')) continue;
    sOut.push_back(cOut);
  }
  while (!sOut.empty() && sOut.back() == '-') sOut.pop_back();
  return sOut;
}

std::string joinParts(const std::string& sA, const std::string& sB) {
  if (sA.empty()) return sB;
  if (sB.empty()) return sA;
  return sA + "-" + sB;
}

}  // namespace

size_t maxNameLength(ResourceKind kind) {
  return kind == ResourceKind::ServiceAccount ? kServiceAccountIdLimit : kComputeNameLimit;
}

std::string resourceName(ResourceKind kind, const std::string& sPrefix,
                         const std::string& sQualifier) {
  const std::string sTail =
      sanitize(joinParts(kindSuffix(kind, sQualifier), sQualifier));
  std::string sHead = sanitize(sPrefix);
  const size_t nLimit = maxNameLength(kind);

  if (sTail.size() >= nLimit) {
    std::string sOut = sTail.substr(0, nLimit);
    while (!sOut.empty() && sOut.back() == '-') sOut.pop_back();
    return sOut;
  }

  // Room left for the prefix once "-<tail>" is reserved
  const size_t nHeadRoom = nLimit - sTail.size() - (sHead.empty() ? 0 : 1);
  if (sHead.size() > nHeadRoom) {
    sHead.resize(nHeadRoom);
    while (!sHead.empty() && sHead.back() == '-') sHead.pop_back();
  }
  return joinParts(sHead, sTail);
}

std::string kindLabel(ResourceKind kind) {
  switch (kind) {
    case ResourceKind::Network:        return "network";
    case ResourceKind::Subnet:         return "subnet";
    case ResourceKind::FirewallRule:   return "firewall-rule";
    case ResourceKind::ServiceAccount: return "service-account";
    case ResourceKind::Disk:           return "disk";
    case ResourceKind::Instance:       return "instance";
    case ResourceKind::Secret:         return "secret";
    case ResourceKind::UptimeCheck:    return "uptime-check";
    case ResourceKind::AlertPolicy:    return "alert-policy";
    case ResourceKind::Dashboard:      return "dashboard";
    case ResourceKind::LogMetric:      return "log-metric";
    case ResourceKind::Budget:         return "budget";
  }
  throw std::logic_error("kindLabel: unhandled resource kind");
}

}  // namespace cdp::core
