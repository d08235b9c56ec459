#pragma once

#include <atomic>
#include <filesystem>
#include <string>

#include <unistd.h>

namespace cdp::test {

/// Unique scratch directory under the system temp path, removed on destruction.
class TempDir {
 public:
  TempDir() {
    static std::atomic<int> iCounter{0};
    _path = std::filesystem::temp_directory_path() /
            ("cdp-test-" + std::to_string(::getpid()) + "-" + std::to_string(iCounter++));
    std::filesystem::remove_all(_path);
    std::filesystem::create_directories(_path);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(_path, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return _path; }
  std::string str() const { return _path.string(); }

 private:
  std::filesystem::path _path;
};

}  // namespace cdp::test
