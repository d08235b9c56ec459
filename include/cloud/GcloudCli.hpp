#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cloud/IProcessRunner.hpp"
#include "common/Types.hpp"

namespace cdp::cloud {

/// Builds and runs `gcloud` invocations. Every call is non-interactive
/// (--quiet) and pinned to the configured project when one is set.
/// Class abbreviation: gc
class GcloudCli {
 public:
  GcloudCli(IProcessRunner& prRunner, std::string sProjectId);
  ~GcloudCli();

  /// Full argv for `gcloud <vArgs...> --quiet [--project=...]`.
  std::vector<std::string> argv(const std::vector<std::string>& vArgs) const;

  /// Run and return the raw result. Never throws on non-zero exit.
  common::CommandResult exec(const std::vector<std::string>& vArgs,
                             const std::string& sStdin = {});

  /// Run with --format=json and parse stdout.
  /// Throws CloudCommandError on non-zero exit or malformed JSON.
  nlohmann::json execJson(const std::vector<std::string>& vArgs);

  /// Run and require exit 0. Throws CloudCommandError naming sWhat otherwise.
  common::CommandResult execChecked(const std::string& sWhat,
                                    const std::vector<std::string>& vArgs,
                                    const std::string& sStdin = {});

  /// Run a describe-style probe. True on exit 0, false when gcloud reports
  /// the resource as not found. Any other failure (auth, quota, transient
  /// API errors) throws CloudCommandError naming sWhat.
  bool execExists(const std::string& sWhat, const std::vector<std::string>& vArgs);

  /// True when stderr carries a NOT_FOUND / "was not found" diagnostic.
  static bool isNotFound(const std::string& sStderr);

  const std::string& projectId() const { return _sProjectId; }

  /// Last path segment of a resource URL or name ("zones/us-central1-a" -> "us-central1-a").
  static std::string basename(const std::string& sResource);

  /// First non-empty line, trimmed.
  static std::string firstLine(const std::string& sOutput);

 private:
  IProcessRunner& _prRunner;
  std::string _sProjectId;
};

}  // namespace cdp::cloud
