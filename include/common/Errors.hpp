#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace cdp::common {

/// Base error for all application-level exceptions.
/// Carries the process exit code and machine-readable error code slug.
struct AppError : public std::runtime_error {
  int _iExitCode;
  std::string _sErrorCode;

  explicit AppError(int iExitCode, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iExitCode(iExitCode),
        _sErrorCode(std::move(sCode)) {}
};

/// Exit 2: configuration file or override values are invalid.
struct ConfigError : AppError {
  explicit ConfigError(std::string sCode, std::string sMsg)
      : AppError(2, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 3: ambient auth/project context missing (gcloud not installed,
/// no active account, no project). Requires operator action.
struct PrerequisiteError : AppError {
  explicit PrerequisiteError(std::string sCode, std::string sMsg)
      : AppError(3, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 4: a HARD compliance rule failed. Nothing was created.
struct ComplianceError : AppError {
  explicit ComplianceError(std::string sCode, std::string sMsg)
      : AppError(4, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 5: a create action or a remote step failed. Safe to re-run.
struct ReconciliationError : AppError {
  explicit ReconciliationError(std::string sCode, std::string sMsg)
      : AppError(5, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 6: a phase needs deployment state that no earlier phase recorded.
struct MissingStateError : AppError {
  std::string _sMissingKey;

  explicit MissingStateError(std::string sMissingKey, std::string sMsg)
      : AppError(6, "missing_state", std::move(sMsg)),
        _sMissingKey(std::move(sMissingKey)) {}
};

/// Exit 7: a cloud CLI invocation failed or returned unparseable output.
/// Reconciler and cleanup paths convert this into outcomes or warnings.
struct CloudCommandError : AppError {
  explicit CloudCommandError(std::string sCode, std::string sMsg)
      : AppError(7, std::move(sCode), std::move(sMsg)) {}
};

}  // namespace cdp::common
