#include "common/Logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <vector>

namespace cdp::common {

bool Logger::_bInitialized = false;
std::string Logger::_sLogFile;
spdlog::sink_ptr Logger::_spFileSink;

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

spdlog::sink_ptr openFileSink(const std::string& sLogFile) {
  const auto pathParent = std::filesystem::path(sLogFile).parent_path();
  if (!pathParent.empty()) {
    std::filesystem::create_directories(pathParent);
  }
  return std::make_shared<spdlog::sinks::basic_file_sink_mt>(sLogFile, false);
}

}  // namespace

void Logger::init(const std::string& sLevel, const std::string& sLogFile) {
  if (_bInitialized) {
    // Re-initialization: update level, and move file output if a new path is given
    spdlog::set_level(spdlog::level::from_str(sLevel));
    if (!sLogFile.empty() && sLogFile != _sLogFile) {
      auto spSink = openFileSink(sLogFile);
      spSink->set_pattern(kPattern);
      auto& vSinks = spdlog::default_logger()->sinks();
      if (_spFileSink) {
        vSinks.erase(std::remove(vSinks.begin(), vSinks.end(), _spFileSink), vSinks.end());
      }
      vSinks.push_back(spSink);
      _spFileSink = spSink;
      _sLogFile = sLogFile;
    }
    return;
  }

  std::vector<spdlog::sink_ptr> vSinks;
  vSinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  if (!sLogFile.empty()) {
    _spFileSink = openFileSink(sLogFile);
    vSinks.push_back(_spFileSink);
    _sLogFile = sLogFile;
  }

  auto spLogger = std::make_shared<spdlog::logger>("cdp", vSinks.begin(), vSinks.end());
  spLogger->set_pattern(kPattern);

  auto level = spdlog::level::from_str(sLevel);
  spLogger->set_level(level);
  spLogger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(spLogger);

  _bInitialized = true;
  spLogger->debug("Logger initialized at level '{}'", sLevel);
}

std::shared_ptr<spdlog::logger> Logger::get() {
  if (!_bInitialized) {
    init("info");
  }
  return spdlog::default_logger();
}

const std::string& Logger::logFilePath() { return _sLogFile; }

std::string Logger::timestampedLogPath(const std::string& sLogDir) {
  const std::time_t tNow = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tmLocal{};
  localtime_r(&tNow, &tmLocal);
  char szStamp[32];
  std::strftime(szStamp, sizeof(szStamp), "%Y%m%d_%H%M%S", &tmLocal);
  return (std::filesystem::path(sLogDir) / ("deployment-" + std::string(szStamp) + ".log"))
      .string();
}

}  // namespace cdp::common
