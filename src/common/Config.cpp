#include "common/Config.hpp"

#include "common/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace cdp::common {

namespace {

std::string trim(const std::string& sValue) {
  const auto iBegin = sValue.find_first_not_of(" \t\r\n");
  if (iBegin == std::string::npos) return {};
  const auto iEnd = sValue.find_last_not_of(" \t\r\n");
  return sValue.substr(iBegin, iEnd - iBegin + 1);
}

std::string unquote(const std::string& sValue) {
  if (sValue.size() >= 2 &&
      ((sValue.front() == '"' && sValue.back() == '"') ||
       (sValue.front() == '\'' && sValue.back() == '\''))) {
    return sValue.substr(1, sValue.size() - 2);
  }
  return sValue;
}

}  // namespace

std::string Config::getEnv(const std::string& sVarName) {
  const char* pValue = std::getenv(sVarName.c_str());
  return pValue ? std::string(pValue) : std::string{};
}

std::string Config::lookup(const std::map<std::string, std::string>& mFile,
                           const std::string& sKey) {
  std::string sValue = getEnv("CDP_" + sKey);
  if (!sValue.empty()) {
    return sValue;
  }
  auto it = mFile.find(sKey);
  return it != mFile.end() ? it->second : std::string{};
}

int Config::lookupInt(const std::map<std::string, std::string>& mFile,
                      const std::string& sKey, int iDefault) {
  const std::string sValue = lookup(mFile, sKey);
  if (sValue.empty()) {
    return iDefault;
  }
  try {
    size_t nPos = 0;
    int iValue = std::stoi(sValue, &nPos);
    if (nPos != sValue.size()) {
      throw std::invalid_argument(sValue);
    }
    return iValue;
  } catch (const std::exception&) {
    throw ConfigError("invalid_integer", "Invalid integer value for " + sKey + ": " + sValue);
  }
}

std::map<std::string, std::string> Config::parseEnvFile(const std::string& sPath) {
  std::map<std::string, std::string> mValues;
  std::ifstream ifs(sPath);
  if (!ifs.is_open()) {
    return mValues;
  }

  std::string sLine;
  int iLineNo = 0;
  while (std::getline(ifs, sLine)) {
    ++iLineNo;
    std::string sTrimmed = trim(sLine);
    if (sTrimmed.empty() || sTrimmed.front() == '#') continue;
    if (sTrimmed.rfind("export ", 0) == 0) {
      sTrimmed = trim(sTrimmed.substr(7));
    }

    const auto iEq = sTrimmed.find('=');
    if (iEq == std::string::npos || iEq == 0) {
      throw ConfigError("invalid_env_file",
                        sPath + ":" + std::to_string(iLineNo) + ": expected KEY=value");
    }

    std::string sKey = trim(sTrimmed.substr(0, iEq));
    std::string sValue = trim(sTrimmed.substr(iEq + 1));
    // Strip a trailing comment from unquoted values
    if (!sValue.empty() && sValue.front() != '"' && sValue.front() != '\'') {
      const auto iHash = sValue.find(" #");
      if (iHash != std::string::npos) {
        sValue = trim(sValue.substr(0, iHash));
      }
    }
    mValues[sKey] = unquote(sValue);
  }
  return mValues;
}

int Config::parseDiskSizeGb(const std::string& sValue) {
  std::string sDigits = trim(sValue);
  std::string sUpper = sDigits;
  std::transform(sUpper.begin(), sUpper.end(), sUpper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (sUpper.size() > 2 && sUpper.substr(sUpper.size() - 2) == "GB") {
    sDigits = sDigits.substr(0, sDigits.size() - 2);
  }
  if (sDigits.empty() ||
      !std::all_of(sDigits.begin(), sDigits.end(),
                   [](unsigned char c) { return std::isdigit(c) != 0; })) {
    throw ConfigError("invalid_disk_size", "Invalid disk size: " + sValue);
  }
  try {
    return std::stoi(sDigits);
  } catch (const std::exception&) {
    throw ConfigError("invalid_disk_size", "Invalid disk size: " + sValue);
  }
}

std::string Config::resourcePrefix() const { return sProjectId + "-" + sAppName; }

Config Config::load(const std::string& sEnvironment, const std::string& sConfigDir) {
  Config cfg;
  cfg.sEnvironment = sEnvironment;

  const auto pathFile = std::filesystem::path(sConfigDir) / (sEnvironment + ".env");
  const auto mFile = parseEnvFile(pathFile.string());

  auto assign = [&mFile](std::string& sField, const char* pKey) {
    std::string sValue = lookup(mFile, pKey);
    if (!sValue.empty()) {
      sField = sValue;
    }
  };

  // ── Target ─────────────────────────────────────────────────────────────
  assign(cfg.sProjectId, "PROJECT_ID");
  assign(cfg.sRegion, "REGION");
  assign(cfg.sZone, "ZONE");

  // ── Compute ────────────────────────────────────────────────────────────
  assign(cfg.sMachineType, "MACHINE_TYPE");
  const std::string sDiskSize = lookup(mFile, "DISK_SIZE");
  if (!sDiskSize.empty()) {
    cfg.iDiskSizeGb = parseDiskSizeGb(sDiskSize);
  }
  assign(cfg.sDiskType, "DISK_TYPE");
  assign(cfg.sImageFamily, "IMAGE_FAMILY");
  assign(cfg.sImageProject, "IMAGE_PROJECT");

  // ── Application ────────────────────────────────────────────────────────
  assign(cfg.sAppName, "APP_NAME");
  assign(cfg.sApiKeySecretName, "API_KEY_SECRET_NAME");
  const std::string sArchive = lookup(mFile, "APP_ARCHIVE");
  if (!sArchive.empty()) {
    cfg.oAppArchivePath = sArchive;
  }
  cfg.iAppPort = lookupInt(mFile, "APP_PORT", cfg.iAppPort);

  // ── Billing ────────────────────────────────────────────────────────────
  cfg.iBudgetAmountUsd = lookupInt(mFile, "BUDGET_AMOUNT_USD", cfg.iBudgetAmountUsd);

  // ── Readiness polling ──────────────────────────────────────────────────
  cfg.iReadyPollAttempts = lookupInt(mFile, "READY_POLL_ATTEMPTS", cfg.iReadyPollAttempts);
  cfg.iReadyPollIntervalSeconds =
      lookupInt(mFile, "READY_POLL_INTERVAL_SECONDS", cfg.iReadyPollIntervalSeconds);

  // ── Paths / logging ────────────────────────────────────────────────────
  assign(cfg.sStateDir, "STATE_DIR");
  assign(cfg.sLogDir, "LOG_DIR");
  assign(cfg.sLogLevel, "LOG_LEVEL");

  return cfg;
}

void Config::validate() const {
  if (sProjectId.empty()) {
    throw ConfigError("missing_project", "PROJECT_ID is not set");
  }
  if (sRegion.empty() || sZone.empty()) {
    throw ConfigError("missing_location", "REGION and ZONE must both be set");
  }
  if (sAppName.empty()) {
    throw ConfigError("missing_app_name", "APP_NAME must not be empty");
  }
  if (iDiskSizeGb < 10) {
    throw ConfigError("invalid_disk_size",
                      "DISK_SIZE must be at least 10GB (got " + std::to_string(iDiskSizeGb) +
                          "GB)");
  }
  if (iAppPort < 1 || iAppPort > 65535) {
    throw ConfigError("invalid_port", "APP_PORT out of range: " + std::to_string(iAppPort));
  }
  if (iBudgetAmountUsd < 1) {
    throw ConfigError("invalid_budget", "BUDGET_AMOUNT_USD must be >= 1");
  }
  if (iReadyPollAttempts < 1 || iReadyPollIntervalSeconds < 0) {
    throw ConfigError("invalid_polling",
                      "READY_POLL_ATTEMPTS must be >= 1 and READY_POLL_INTERVAL_SECONDS >= 0");
  }
}

}  // namespace cdp::common
