#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace cdp::common {

/// Thin wrapper over spdlog for structured logging.
/// Uses spdlog's default logger to avoid static destruction order issues.
/// Class abbreviation: N/A (static interface)
///
/// Usage:
///   Logger::init("debug", "logs/deployment-20260101_120000.log");
///   Logger::get()->info("Running phase {}", iPhase);
class Logger {
 public:
  /// Initialize the global logger with the given level string.
  /// Valid levels: "trace", "debug", "info", "warn", "error", "critical", "off"
  /// When sLogFile is non-empty every message is also appended to that file.
  /// Calling again updates the level and, given a different sLogFile, moves
  /// file output there. Throws spdlog::spdlog_ex if the file cannot be opened.
  static void init(const std::string& sLevel, const std::string& sLogFile = {});

  /// Get the shared spdlog logger instance.
  /// Returns spdlog's default logger (always valid).
  static std::shared_ptr<spdlog::logger> get();

  /// Path of the per-invocation log file, empty if file logging is off.
  static const std::string& logFilePath();

  /// "<sLogDir>/deployment-YYYYMMDD_HHMMSS.log" for the current local time.
  static std::string timestampedLogPath(const std::string& sLogDir);

 private:
  static bool _bInitialized;
  static std::string _sLogFile;
  static spdlog::sink_ptr _spFileSink;
};

}  // namespace cdp::common
