#pragma once

#include <string>
#include <vector>

#include "common/Types.hpp"

namespace cdp::cloud {

/// Pure abstract interface for synchronous child-process execution.
class IProcessRunner {
 public:
  virtual ~IProcessRunner() = default;

  /// Run vArgv[0] (resolved through PATH) with the remaining arguments and
  /// block until it exits. sStdin is written to the child's standard input.
  /// Throws std::system_error if the process cannot be started.
  virtual common::CommandResult run(const std::vector<std::string>& vArgv,
                                    const std::string& sStdin = {}) = 0;
};

}  // namespace cdp::cloud
