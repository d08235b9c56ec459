#include "common/Startup.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <cstdlib>
#include <string>

namespace cdp::common {

namespace {

std::string initialLogDir(const StartupOptions& soOptions) {
  if (!soOptions.sLogDir.empty()) {
    return soOptions.sLogDir;
  }
  const char* pDir = std::getenv("CDP_LOG_DIR");
  if (pDir && *pDir) {
    return pDir;
  }
  return Config{}.sLogDir;
}

void checkModeFlags(const StartupOptions& soOptions) {
  if (soOptions.bValidateOnly && soOptions.bCleanup) {
    throw ConfigError("invalid_flags", "--validate-only cannot be combined with --cleanup");
  }
  if (soOptions.bDryRun && !soOptions.bCleanup) {
    throw ConfigError("invalid_flags", "--dry-run requires --cleanup");
  }
}

}  // namespace

Config bootstrap(const StartupOptions& soOptions) {
  const std::string sLogDir = initialLogDir(soOptions);
  Logger::init(soOptions.bVerbose ? "debug" : "info", Logger::timestampedLogPath(sLogDir));
  auto spLog = Logger::get();

  try {
    checkModeFlags(soOptions);
  } catch (const AppError& ex) {
    spLog->error("Rejected command line: {}", ex.what());
    throw;
  }

  Config cfg;
  try {
    cfg = Config::load(soOptions.sEnvironment, soOptions.sConfigDir);
  } catch (const AppError& ex) {
    spLog->error("Could not load {} configuration from {}: {}", soOptions.sEnvironment,
                 soOptions.sConfigDir, ex.what());
    throw;
  }

  if (!soOptions.sStateDir.empty()) cfg.sStateDir = soOptions.sStateDir;
  if (soOptions.bVerbose) cfg.sLogLevel = "debug";
  cfg.bForce = soOptions.bForce;

  // LOG_DIR from the env file is only known now; move the file sink there.
  if (!soOptions.sLogDir.empty() || cfg.sLogDir == sLogDir) {
    cfg.sLogDir = sLogDir;
    Logger::init(cfg.sLogLevel);
  } else {
    const std::string sLogFile = Logger::timestampedLogPath(cfg.sLogDir);
    spLog->info("Log output continues in {}", sLogFile);
    Logger::init(cfg.sLogLevel, sLogFile);
  }

  spLog->info("Environment {}, config dir {}", cfg.sEnvironment, soOptions.sConfigDir);
  return cfg;
}

}  // namespace cdp::common
