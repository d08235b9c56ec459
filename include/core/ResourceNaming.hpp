#pragma once

#include <string>

#include "common/Types.hpp"

namespace cdp::core {

/// Longest identifier a kind accepts (63 for compute objects, 30 for
/// service-account ids).
size_t maxNameLength(common::ResourceKind kind);

/// Deterministic identifier for a resource: "<prefix>-<suffix>[-<qualifier>]".
/// Lowercased, restricted to [a-z0-9-], runs of '-' collapsed. When the result
/// exceeds the kind's limit the prefix is shortened so the kind suffix
/// survives, and no trailing hyphen remains.
std::string resourceName(common::ResourceKind kind, const std::string& sPrefix,
                         const std::string& sQualifier = {});

/// Human-readable kind, e.g. "firewall-rule". Used in logs and reports.
std::string kindLabel(common::ResourceKind kind);

}  // namespace cdp::core
