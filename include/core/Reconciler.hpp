#pragma once

#include <vector>

#include "cloud/ICloudClient.hpp"
#include "common/Types.hpp"

namespace cdp::core {

/// Check-then-create primitive. Never updates or retries.
/// Class abbreviation: rcn
class Reconciler {
 public:
  explicit Reconciler(cloud::ICloudClient& icClient);
  ~Reconciler();

  /// Evaluate existence, then create if absent. Errors raised by the client
  /// become a Failed outcome carrying the error text.
  common::ReconcileOutcome reconcile(const common::ResourceDescriptor& rdResource);

  /// Reconcile in order. Stops after the first failed non-optional descriptor;
  /// the returned outcomes end with that failure.
  std::vector<common::ReconcileOutcome> reconcileAll(
      const std::vector<common::ResourceDescriptor>& vResources);

 private:
  cloud::ICloudClient& _icClient;
};

}  // namespace cdp::core
