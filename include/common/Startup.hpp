#pragma once

#include <string>

#include "common/Config.hpp"

namespace cdp::common {

/// Command-line values that shape configuration loading.
/// Class abbreviation: so
struct StartupOptions {
  std::string sEnvironment = "production";
  std::string sConfigDir = "config";
  std::string sStateDir;  // empty: keep the configured value
  std::string sLogDir;    // empty: CDP_LOG_DIR, then the configured value
  bool bVerbose = false;
  bool bForce = false;
  bool bCleanup = false;
  bool bDryRun = false;
  bool bValidateOnly = false;
};

/// Open the per-invocation log file, then load configuration and apply the
/// command-line overrides. Because the file sink exists before the env file
/// is parsed, a ConfigError raised here is already recorded in the log.
/// Contradictory mode flags raise ConfigError("invalid_flags"). The project
/// id is not resolved and validate() is not called.
Config bootstrap(const StartupOptions& soOptions);

}  // namespace cdp::common
