#include <cstdlib>
#include <ctime>
#include <iostream>
#include <string>
#include <exception>
#include <vector>

#include <CLI/CLI.hpp>

#include "cloud/GcloudClient.hpp"
#include "cloud/PosixProcessRunner.hpp"
#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "common/Startup.hpp"
#include "core/CleanupEngine.hpp"
#include "core/PhaseFactory.hpp"
#include "core/PhaseOrchestrator.hpp"
#include "core/ResourceNaming.hpp"
#include "dal/StateStore.hpp"

namespace {

struct CliOptions {
  std::string sEnvironment = "production";
  std::vector<int> vPhases;
  bool bCleanup = false;
  bool bDryRun = false;
  bool bForce = false;
  bool bValidateOnly = false;
  bool bVerbose = false;
  std::string sConfigDir = "config";
  std::string sStateDir;
  std::string sLogDir;
};

void printFatal(const std::string& sMessage) {
  const std::time_t tNow = std::time(nullptr);
  std::tm tmLocal{};
  localtime_r(&tNow, &tmLocal);
  char vStamp[32];
  std::strftime(vStamp, sizeof(vStamp), "%Y-%m-%d %H:%M:%S", &tmLocal);
  std::cerr << "[" << vStamp << "] [fatal] " << sMessage << "\n";
  const auto& sLogFile = cdp::common::Logger::logFilePath();
  if (!sLogFile.empty()) {
    std::cerr << "Full log: " << sLogFile << "\n";
  }
}

bool confirmCleanup(const cdp::common::Config& cfg) {
  std::cout << "This deletes every resource of " << cfg.resourcePrefix() << " in project "
            << cfg.sProjectId << " (environment " << cfg.sEnvironment << ").\n"
            << "Type 'yes' to confirm: " << std::flush;
  std::string sAnswer;
  std::getline(std::cin, sAnswer);
  return sAnswer == "yes";
}

void printSummary(const cdp::core::RunResult& rrResult) {
  auto spLog = cdp::common::Logger::get();
  if (rrResult.oCleanup) {
    const auto& crp = *rrResult.oCleanup;
    if (crp.mode == cdp::core::CleanupMode::DryRun) {
      spLog->info("Dry run: {} item(s) would be deleted", crp.pendingCount());
    } else {
      for (const auto& ci : crp.vSurvivors) {
        spLog->warn("Still present: {} {}", cdp::core::kindLabel(ci.kind), ci.sName);
      }
      for (const auto& sPath : crp.vRemainingState) {
        spLog->warn("Still present: {}", sPath);
      }
      spLog->info("Cleanup finished, {} survivor(s)", crp.pendingCount());
    }
  }
  for (const auto& bew : rrResult.vWarnings) {
    spLog->warn("  - {}: {}", bew.sSource, bew.sMessage);
  }
  if (rrResult.oAccessUrl) {
    spLog->info("Deployment complete: {}", *rrResult.oAccessUrl);
  }
}

}  // namespace

int main(int argc, char** argv) {
  CliOptions cliOpts;
  CLI::App app{"cloud-deployer - phased free-tier deployment to Google Compute Engine"};

  app.add_option("-e,--environment", cliOpts.sEnvironment, "Target environment")
      ->capture_default_str();
  app.add_option("-p,--phases", cliOpts.vPhases, "Comma-separated phases to run (1-6)")
      ->delimiter(',');
  app.add_flag("-c,--cleanup", cliOpts.bCleanup, "Delete every deployed resource");
  app.add_flag("--dry-run", cliOpts.bDryRun, "With --cleanup, list what would be deleted");
  app.add_flag("--force", cliOpts.bForce,
               "Downgrade override-able compliance failures and skip the cleanup prompt");
  app.add_flag("--validate-only", cliOpts.bValidateOnly,
               "Run prerequisite and compliance checks only");
  app.add_flag("-v,--verbose", cliOpts.bVerbose, "Debug logging");
  app.add_option("--config-dir", cliOpts.sConfigDir, "Directory holding <environment>.env")
      ->capture_default_str();
  app.add_option("--state-dir", cliOpts.sStateDir, "Directory for deployment state files");
  app.add_option("--log-dir", cliOpts.sLogDir, "Directory for per-run log files");

  CLI11_PARSE(app, argc, argv);

  try {
    // ── Step 1: Logging, then configuration ───────────────────────────────
    cdp::common::StartupOptions soOptions;
    soOptions.sEnvironment = cliOpts.sEnvironment;
    soOptions.sConfigDir = cliOpts.sConfigDir;
    soOptions.sStateDir = cliOpts.sStateDir;
    soOptions.sLogDir = cliOpts.sLogDir;
    soOptions.bVerbose = cliOpts.bVerbose;
    soOptions.bForce = cliOpts.bForce;
    soOptions.bCleanup = cliOpts.bCleanup;
    soOptions.bDryRun = cliOpts.bDryRun;
    soOptions.bValidateOnly = cliOpts.bValidateOnly;
    auto cfgApp = cdp::common::bootstrap(soOptions);
    auto spLog = cdp::common::Logger::get();

    // ── Step 2: Resolve the project and validate ──────────────────────────
    cdp::cloud::PosixProcessRunner pprRunner;
    if (cfgApp.sProjectId.empty()) {
      cdp::cloud::GcloudClient gccProbe(pprRunner, "");
      cfgApp.sProjectId = gccProbe.activeProject();
      if (cfgApp.sProjectId.empty()) {
        throw cdp::common::PrerequisiteError(
            "no_project", "No project configured; set PROJECT_ID or run "
                          "'gcloud config set project PROJECT_ID'");
      }
      spLog->info("Using active gcloud project {}", cfgApp.sProjectId);
    }
    cfgApp.validate();

    // ── Step 3: Collaborators ─────────────────────────────────────────────
    cdp::cloud::GcloudClient gccClient(pprRunner, cfgApp.sProjectId);
    cdp::dal::StateStore ssStore(cfgApp.sStateDir, cfgApp.sEnvironment);
    cdp::core::PhaseOrchestrator poOrchestrator(cfgApp, gccClient, ssStore,
                                                cdp::core::makeDefaultPhases());

    // ── Step 4: Run ───────────────────────────────────────────────────────
    cdp::core::RunRequest rqRequest;
    rqRequest.vPhases = cliOpts.vPhases;
    if (cliOpts.bValidateOnly) {
      rqRequest.mode = cdp::core::RunMode::ValidateOnly;
    } else if (cliOpts.bCleanup) {
      rqRequest.mode = cdp::core::RunMode::Cleanup;
      rqRequest.cleanupMode =
          cliOpts.bDryRun ? cdp::core::CleanupMode::DryRun : cdp::core::CleanupMode::Execute;
      if (!cliOpts.bDryRun && !cliOpts.bForce && !confirmCleanup(cfgApp)) {
        spLog->info("Cleanup cancelled by user");
        return EXIT_SUCCESS;
      }
    }

    auto rrResult = poOrchestrator.run(rqRequest);
    printSummary(rrResult);
    if (!rrResult.ok()) {
      spLog->error("Run aborted [{}]: {}", rrResult.sErrorCode, rrResult.sAbortReason);
      printFatal(rrResult.sAbortReason);
      return rrResult.iExitCode;
    }
    return EXIT_SUCCESS;
  } catch (const cdp::common::AppError& ex) {
    if (auto spLog = cdp::common::Logger::get()) {
      spLog->critical("{}", ex.what());
    }
    printFatal(ex.what());
    return ex._iExitCode;
  } catch (const std::exception& ex) {
    if (auto spLog = cdp::common::Logger::get()) {
      spLog->critical("Internal error: {}", ex.what());
    }
    printFatal(std::string("Internal error: ") + ex.what());
    return EXIT_FAILURE;
  }
}
