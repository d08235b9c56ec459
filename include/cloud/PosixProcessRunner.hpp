#pragma once

#include <string>
#include <vector>

#include "cloud/IProcessRunner.hpp"

namespace cdp::cloud {

/// fork/exec runner that captures stdout and stderr through pipes.
/// Class abbreviation: ppr
class PosixProcessRunner : public IProcessRunner {
 public:
  PosixProcessRunner();
  ~PosixProcessRunner() override;

  common::CommandResult run(const std::vector<std::string>& vArgv,
                            const std::string& sStdin = {}) override;
};

}  // namespace cdp::cloud
