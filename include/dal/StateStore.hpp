#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "dal/DeploymentState.hpp"

namespace cdp::dal {

/// Persists DeploymentState as flat KEY="value" files under
/// <state-dir>/<environment>/, one file per StateField.
/// Class abbreviation: ss
class StateStore {
 public:
  StateStore(const std::string& sStateDir, const std::string& sEnvironment);
  ~StateStore();

  /// Write one category from the typed state. Throws MissingStateError if the
  /// state does not hold that field. Temp file + rename; sensitive
  /// categories are created with mode 0600.
  void write(int iPhaseId, StateField field, const DeploymentState& dsState);

  /// Raw lookup of a flat key across all category files.
  /// Throws MissingStateError naming the key and its producing phase.
  std::string read(const std::string& sKey) const;

  /// Rebuild the typed state from whichever category files exist.
  DeploymentState load() const;

  bool exists(StateField field) const;

  /// Delete every category file. Returns the paths that were removed.
  std::vector<std::string> removeAll();

  std::filesystem::path pathFor(StateField field) const;
  const std::filesystem::path& directory() const { return _pathDir; }

 private:
  std::map<std::string, std::string> readField(StateField field) const;

  std::filesystem::path _pathDir;
};

}  // namespace cdp::dal
