#include "cloud/GcloudCli.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace cdp::cloud {

namespace {
constexpr const char* kGcloudBinary = "gcloud";
constexpr size_t kMaxErrorExcerpt = 400;

std::string excerpt(const std::string& sText) {
  std::string sOut = sText.substr(0, kMaxErrorExcerpt);
  while (!sOut.empty() && (sOut.back() == '\n' || sOut.back() == '\r' || sOut.back() == ' ')) {
    sOut.pop_back();
  }
  return sOut;
}
}  // namespace

GcloudCli::GcloudCli(IProcessRunner& prRunner, std::string sProjectId)
    : _prRunner(prRunner), _sProjectId(std::move(sProjectId)) {}

GcloudCli::~GcloudCli() = default;

std::vector<std::string> GcloudCli::argv(const std::vector<std::string>& vArgs) const {
  std::vector<std::string> vArgv;
  vArgv.reserve(vArgs.size() + 3);
  vArgv.emplace_back(kGcloudBinary);
  vArgv.insert(vArgv.end(), vArgs.begin(), vArgs.end());
  vArgv.emplace_back("--quiet");
  if (!_sProjectId.empty()) {
    vArgv.push_back("--project=" + _sProjectId);
  }
  return vArgv;
}

common::CommandResult GcloudCli::exec(const std::vector<std::string>& vArgs,
                                      const std::string& sStdin) {
  auto cmr = _prRunner.run(argv(vArgs), sStdin);
  if (!cmr.ok()) {
    common::Logger::get()->debug("gcloud {} exited {}: {}",
                                 vArgs.empty() ? std::string{} : vArgs.front(), cmr.iExitCode,
                                 excerpt(cmr.sStderr));
  }
  return cmr;
}

nlohmann::json GcloudCli::execJson(const std::vector<std::string>& vArgs) {
  std::vector<std::string> vWithFormat = vArgs;
  vWithFormat.emplace_back("--format=json");
  auto cmr = exec(vWithFormat);
  if (!cmr.ok()) {
    throw common::CloudCommandError("gcloud_failed",
                                    "gcloud " + (vArgs.empty() ? std::string{} : vArgs.front()) +
                                        " exited " + std::to_string(cmr.iExitCode) + ": " +
                                        excerpt(cmr.sStderr));
  }
  if (cmr.sStdout.find_first_not_of(" \t\r\n") == std::string::npos) {
    return nlohmann::json::array();
  }
  try {
    return nlohmann::json::parse(cmr.sStdout);
  } catch (const nlohmann::json::parse_error& ex) {
    throw common::CloudCommandError("gcloud_bad_output",
                                    std::string("Unparseable gcloud output: ") + ex.what());
  }
}

common::CommandResult GcloudCli::execChecked(const std::string& sWhat,
                                             const std::vector<std::string>& vArgs,
                                             const std::string& sStdin) {
  auto cmr = exec(vArgs, sStdin);
  if (!cmr.ok()) {
    throw common::CloudCommandError(
        "gcloud_failed",
        sWhat + " failed (exit " + std::to_string(cmr.iExitCode) + "): " + excerpt(cmr.sStderr));
  }
  return cmr;
}

bool GcloudCli::execExists(const std::string& sWhat, const std::vector<std::string>& vArgs) {
  auto cmr = exec(vArgs);
  if (cmr.ok()) {
    return true;
  }
  if (isNotFound(cmr.sStderr)) {
    return false;
  }
  throw common::CloudCommandError(
      "gcloud_failed", "Existence check for " + sWhat + " failed (exit " +
                           std::to_string(cmr.iExitCode) + "): " + excerpt(cmr.sStderr));
}

bool GcloudCli::isNotFound(const std::string& sStderr) {
  std::string sLower = sStderr;
  std::transform(sLower.begin(), sLower.end(), sLower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return sLower.find("not_found") != std::string::npos ||
         sLower.find("not found") != std::string::npos;
}

std::string GcloudCli::basename(const std::string& sResource) {
  const auto iSlash = sResource.find_last_of('/');
  return iSlash == std::string::npos ? sResource : sResource.substr(iSlash + 1);
}

std::string GcloudCli::firstLine(const std::string& sOutput) {
  std::istringstream iss(sOutput);
  std::string sLine;
  while (std::getline(iss, sLine)) {
    const auto iBegin = sLine.find_first_not_of(" \t\r");
    if (iBegin == std::string::npos) continue;
    const auto iEnd = sLine.find_last_not_of(" \t\r");
    return sLine.substr(iBegin, iEnd - iBegin + 1);
  }
  return {};
}

}  // namespace cdp::cloud
