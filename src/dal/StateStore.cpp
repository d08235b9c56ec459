#include "dal/StateStore.hpp"

#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <ctime>
#include <fstream>
#include <system_error>
#include <utility>

namespace cdp::dal {

namespace fs = std::filesystem;

namespace {

using KeyValues = std::vector<std::pair<std::string, std::string>>;

/// Flat keys written for each category, in file order.
const std::vector<std::string>& keysFor(StateField field) {
  static const std::vector<std::string> vInstance = {"INSTANCE_NAME", "ZONE", "INTERNAL_IP",
                                                     "EXTERNAL_IP"};
  static const std::vector<std::string> vCredential = {"API_KEY_SECRET_NAME", "SERVICE_ACCOUNT",
                                                       "KEY_FINGERPRINT"};
  static const std::vector<std::string> vReport = {"DEPLOYED_AT", "ENVIRONMENT", "PROJECT_ID",
                                                   "HTTP_URL",    "HTTPS_URL",   "HEALTH_URL"};
  switch (field) {
    case StateField::InstanceIdentity: return vInstance;
    case StateField::CredentialRef:    return vCredential;
    case StateField::DeploymentReport: return vReport;
  }
  return vInstance;
}

KeyValues serialize(StateField field, const DeploymentState& dsState) {
  switch (field) {
    case StateField::InstanceIdentity: {
      const auto& iid = dsState.instance();
      return {{"INSTANCE_NAME", iid.sName},
              {"ZONE", iid.sZone},
              {"INTERNAL_IP", iid.sInternalIp},
              {"EXTERNAL_IP", iid.sExternalIp}};
    }
    case StateField::CredentialRef: {
      const auto& crf = dsState.credential();
      return {{"API_KEY_SECRET_NAME", crf.sSecretName},
              {"SERVICE_ACCOUNT", crf.sServiceAccount},
              {"KEY_FINGERPRINT", crf.sKeyFingerprint}};
    }
    case StateField::DeploymentReport: {
      const auto& drp = dsState.report();
      return {{"DEPLOYED_AT", drp.sDeployedAt}, {"ENVIRONMENT", drp.sEnvironment},
              {"PROJECT_ID", drp.sProjectId},   {"HTTP_URL", drp.sHttpUrl},
              {"HTTPS_URL", drp.sHttpsUrl},     {"HEALTH_URL", drp.sHealthUrl}};
    }
  }
  return {};
}

std::string value(const std::map<std::string, std::string>& mValues, const char* pKey) {
  auto it = mValues.find(pKey);
  return it != mValues.end() ? it->second : std::string{};
}

std::string nowLocal() {
  const std::time_t tNow = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tmLocal{};
  localtime_r(&tNow, &tmLocal);
  char vBuf[32];
  std::strftime(vBuf, sizeof(vBuf), "%Y-%m-%d %H:%M:%S", &tmLocal);
  return vBuf;
}

}  // namespace

StateStore::StateStore(const std::string& sStateDir, const std::string& sEnvironment)
    : _pathDir(fs::path(sStateDir) / sEnvironment) {}

StateStore::~StateStore() = default;

fs::path StateStore::pathFor(StateField field) const {
  return _pathDir / fieldInfo(field).pFileName;
}

bool StateStore::exists(StateField field) const { return fs::exists(pathFor(field)); }

void StateStore::write(int iPhaseId, StateField field, const DeploymentState& dsState) {
  const auto& sfi = fieldInfo(field);
  const KeyValues vValues = serialize(field, dsState);

  fs::create_directories(_pathDir);
  const fs::path pathFinal = pathFor(field);
  fs::path pathTemp = pathFinal;
  pathTemp += ".tmp";

  {
    std::ofstream ofs(pathTemp, std::ios::out | std::ios::trunc);
    if (!ofs.is_open()) {
      throw std::system_error(errno, std::generic_category(),
                              "Cannot open " + pathTemp.string() + " for writing");
    }
    if (sfi.bSensitive) {
      fs::permissions(pathTemp, fs::perms::owner_read | fs::perms::owner_write,
                      fs::perm_options::replace);
    }
    ofs << "# " << fieldLabel(field) << ", written by phase " << iPhaseId << " at "
        << nowLocal() << "\n";
    for (const auto& [sKey, sValue] : vValues) {
      ofs << sKey << "=\"" << sValue << "\"\n";
    }
    ofs.flush();
    if (!ofs) {
      throw std::system_error(errno, std::generic_category(),
                              "Failed writing " + pathTemp.string());
    }
  }

  fs::rename(pathTemp, pathFinal);
  common::Logger::get()->info("Saved {} to {}", fieldLabel(field), pathFinal.string());
}

std::map<std::string, std::string> StateStore::readField(StateField field) const {
  return common::Config::parseEnvFile(pathFor(field).string());
}

std::string StateStore::read(const std::string& sKey) const {
  for (StateField field : allStateFields()) {
    const auto& vKeys = keysFor(field);
    if (std::find(vKeys.begin(), vKeys.end(), sKey) == vKeys.end()) continue;

    const auto mValues = readField(field);
    auto it = mValues.find(sKey);
    if (it != mValues.end()) return it->second;

    const auto& sfi = fieldInfo(field);
    throw common::MissingStateError(
        sKey, sKey + " not found in " + pathFor(field).string() + "; run phase " +
                  std::to_string(sfi.iProducerPhase) + " (" + sfi.pProducerLabel + ") first");
  }
  throw common::MissingStateError(sKey, "Unknown deployment state key " + sKey);
}

DeploymentState StateStore::load() const {
  DeploymentState ds;

  auto mInstance = readField(StateField::InstanceIdentity);
  if (!value(mInstance, "INSTANCE_NAME").empty()) {
    ds.oInstance = InstanceIdentity{value(mInstance, "INSTANCE_NAME"), value(mInstance, "ZONE"),
                                    value(mInstance, "INTERNAL_IP"),
                                    value(mInstance, "EXTERNAL_IP")};
  }

  auto mCredential = readField(StateField::CredentialRef);
  if (!value(mCredential, "API_KEY_SECRET_NAME").empty()) {
    ds.oCredential = CredentialRef{value(mCredential, "API_KEY_SECRET_NAME"),
                                   value(mCredential, "SERVICE_ACCOUNT"),
                                   value(mCredential, "KEY_FINGERPRINT")};
  }

  auto mReport = readField(StateField::DeploymentReport);
  if (!value(mReport, "DEPLOYED_AT").empty()) {
    ds.oReport = DeploymentReport{value(mReport, "DEPLOYED_AT"), value(mReport, "ENVIRONMENT"),
                                  value(mReport, "PROJECT_ID"),  value(mReport, "HTTP_URL"),
                                  value(mReport, "HTTPS_URL"),   value(mReport, "HEALTH_URL")};
  }
  return ds;
}

std::vector<std::string> StateStore::removeAll() {
  std::vector<std::string> vRemoved;
  for (StateField field : allStateFields()) {
    const fs::path pathFile = pathFor(field);
    std::error_code ec;
    if (fs::remove(pathFile, ec)) {
      vRemoved.push_back(pathFile.string());
    } else if (ec) {
      throw std::system_error(ec, "Cannot remove " + pathFile.string());
    }
  }
  std::error_code ec;
  if (fs::exists(_pathDir, ec) && fs::is_empty(_pathDir, ec)) {
    fs::remove(_pathDir, ec);
  }
  return vRemoved;
}

}  // namespace cdp::dal
