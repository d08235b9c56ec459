#include "core/Reconciler.hpp"

#include "common/Logger.hpp"
#include "core/ResourceNaming.hpp"

#include <exception>
#include <utility>

namespace cdp::core {

using common::ReconcileOutcome;
using common::ReconcileStatus;

Reconciler::Reconciler(cloud::ICloudClient& icClient) : _icClient(icClient) {}
Reconciler::~Reconciler() = default;

ReconcileOutcome Reconciler::reconcile(const common::ResourceDescriptor& rdResource) {
  auto spLog = common::Logger::get();
  ReconcileOutcome ro;
  ro.kind = rdResource.kind;
  ro.sName = rdResource.sName;

  const std::string sKind = kindLabel(rdResource.kind);
  try {
    if (_icClient.exists(rdResource)) {
      ro.status = ReconcileStatus::AlreadyExists;
      spLog->info("{} {} already exists", sKind, rdResource.sName);
      return ro;
    }

    spLog->info("Creating {} {}", sKind, rdResource.sName);
    auto cr = _icClient.create(rdResource);
    if (!cr.bSuccess) {
      ro.status = ReconcileStatus::Failed;
      ro.sReason = cr.sErrorMessage.empty() ? "create action failed" : cr.sErrorMessage;
    } else {
      ro.status = ReconcileStatus::Created;
      ro.mAttributes = std::move(cr.mAttributes);
      spLog->info("{} {} created", sKind, rdResource.sName);
      return ro;
    }
  } catch (const std::exception& ex) {
    ro.status = ReconcileStatus::Failed;
    ro.sReason = ex.what();
  }

  if (rdResource.bOptional) {
    spLog->warn("Could not create optional {} {}: {}", sKind, rdResource.sName, ro.sReason);
  } else {
    spLog->error("Failed to create {} {}: {}", sKind, rdResource.sName, ro.sReason);
  }
  return ro;
}

std::vector<ReconcileOutcome> Reconciler::reconcileAll(
    const std::vector<common::ResourceDescriptor>& vResources) {
  std::vector<ReconcileOutcome> vOutcomes;
  vOutcomes.reserve(vResources.size());
  for (const auto& rd : vResources) {
    vOutcomes.push_back(reconcile(rd));
    if (vOutcomes.back().status == ReconcileStatus::Failed && !rd.bOptional) {
      break;
    }
  }
  return vOutcomes;
}

}  // namespace cdp::core
