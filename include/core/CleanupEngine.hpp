#pragma once

#include <optional>
#include <string>
#include <vector>

#include "cloud/ICloudClient.hpp"
#include "common/Config.hpp"
#include "common/Types.hpp"
#include "core/ResourceCatalog.hpp"
#include "dal/StateStore.hpp"

namespace cdp::core {

enum class CleanupMode { DryRun, Execute };

/// Class abbreviation: ci
struct CleanupItem {
  common::ResourceKind kind = common::ResourceKind::Network;
  std::string sName;
  bool bExisted = false;
  bool bDeleted = false;
};

/// Class abbreviation: crp
struct CleanupReport {
  CleanupMode mode = CleanupMode::DryRun;
  std::vector<CleanupItem> vItems;            // in deletion order
  std::vector<std::string> vLocalState;       // state files present / removed
  std::vector<CleanupItem> vSurvivors;        // still present after execute
  std::vector<std::string> vRemainingState;   // state files left after execute
  std::vector<common::BestEffortWarning> vWarnings;

  /// Resources and state files that a further execute would still delete.
  /// Dry-run: everything found. Execute: the survivors.
  size_t pendingCount() const;
};

/// Reverse-order, best-effort teardown of everything the pipeline creates.
/// Safe to re-run; a failed deletion is a warning, never an abort.
/// Class abbreviation: ce
class CleanupEngine {
 public:
  CleanupEngine(const common::Config& cfg, cloud::ICloudClient& icClient,
                const ResourceCatalog& rcCatalog, dal::StateStore& ssStore);
  ~CleanupEngine();

  CleanupReport cleanup(CleanupMode mode);

 private:
  /// Existence check that turns client errors into a warning and nullopt.
  std::optional<bool> probe(const common::ResourceDescriptor& rdResource,
                            CleanupReport& crpReport);
  void stopServices(CleanupReport& crpReport);
  void verify(CleanupReport& crpReport);

  const common::Config& _cfg;
  cloud::ICloudClient& _icClient;
  const ResourceCatalog& _rcCatalog;
  dal::StateStore& _ssStore;
};

}  // namespace cdp::core
