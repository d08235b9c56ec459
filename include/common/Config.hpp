#pragma once

#include <map>
#include <optional>
#include <string>

namespace cdp::common {

/// Deployment configuration, built once at startup and passed by const
/// reference to every component.
/// Precedence: CDP_<KEY> environment variable > <config-dir>/<env>.env > default.
/// Class abbreviation: cfg
struct Config {
  // ── Target ────────────────────────────────────────────────────────────
  std::string sEnvironment = "production";
  std::string sProjectId;  // falls back to the active gcloud project
  std::string sRegion = "us-central1";
  std::string sZone = "us-central1-a";

  // ── Compute ───────────────────────────────────────────────────────────
  std::string sMachineType = "e2-micro";
  int iDiskSizeGb = 30;
  std::string sDiskType = "pd-standard";
  std::string sImageFamily = "ubuntu-2004-lts";
  std::string sImageProject = "ubuntu-os-cloud";

  // ── Application ───────────────────────────────────────────────────────
  std::string sAppName = "router";
  std::string sApiKeySecretName;  // empty: derived by the resource catalog
  std::optional<std::string> oAppArchivePath;
  int iAppPort = 3456;

  // ── Billing ───────────────────────────────────────────────────────────
  int iBudgetAmountUsd = 1;

  // ── Instance readiness polling ────────────────────────────────────────
  int iReadyPollAttempts = 60;
  int iReadyPollIntervalSeconds = 30;

  // ── Local paths ───────────────────────────────────────────────────────
  std::string sStateDir = ".";
  std::string sLogDir = "logs";

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  // ── Operator overrides ────────────────────────────────────────────────
  bool bForce = false;  // downgrades override-able HARD compliance rules

  /// "<project>-<app>", the root of every derived resource identifier.
  std::string resourcePrefix() const;

  /// Load defaults, then <sConfigDir>/<sEnvironment>.env, then CDP_* env vars.
  /// A missing env file is not an error. Throws ConfigError on bad values.
  static Config load(const std::string& sEnvironment, const std::string& sConfigDir);

  /// Check cross-field constraints. Call after the project id has been
  /// resolved. Throws ConfigError.
  void validate() const;

  /// Parse KEY=value lines. '#' starts a comment, surrounding quotes and an
  /// optional leading "export " are stripped.
  static std::map<std::string, std::string> parseEnvFile(const std::string& sPath);

  /// "30GB", "30gb" or "30" -> 30. Throws ConfigError otherwise.
  static int parseDiskSizeGb(const std::string& sValue);

 private:
  /// Read CDP_<sKey>, then the env file entry sKey. Empty if neither is set.
  static std::string lookup(const std::map<std::string, std::string>& mFile,
                            const std::string& sKey);

  static int lookupInt(const std::map<std::string, std::string>& mFile,
                       const std::string& sKey, int iDefault);

  static std::string getEnv(const std::string& sVarName);
};

}  // namespace cdp::common
