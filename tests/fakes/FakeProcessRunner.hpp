#pragma once

#include <deque>
#include <string>
#include <vector>

#include "cloud/IProcessRunner.hpp"

namespace cdp::test {

/// Records each argv and replays queued results. With an empty queue every
/// command succeeds with empty output.
class FakeProcessRunner : public cloud::IProcessRunner {
 public:
  std::vector<std::vector<std::string>> vInvocations;
  std::vector<std::string> vStdin;
  std::deque<common::CommandResult> dqResults;

  void enqueue(int iExitCode, std::string sStdout = {}, std::string sStderr = {}) {
    dqResults.push_back({iExitCode, std::move(sStdout), std::move(sStderr)});
  }

  common::CommandResult run(const std::vector<std::string>& vArgv,
                            const std::string& sStdin) override {
    vInvocations.push_back(vArgv);
    vStdin.push_back(sStdin);
    if (dqResults.empty()) return {0, "", ""};
    auto cmr = dqResults.front();
    dqResults.pop_front();
    return cmr;
  }

  /// True when the last argv contains sArg.
  bool lastHas(const std::string& sArg) const {
    if (vInvocations.empty()) return false;
    for (const auto& s : vInvocations.back()) {
      if (s == sArg) return true;
    }
    return false;
  }
};

}  // namespace cdp::test
