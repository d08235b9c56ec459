#include "cloud/PosixProcessRunner.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using cdp::cloud::PosixProcessRunner;

TEST(PosixProcessRunnerTest, CapturesStdoutAndStderrSeparately) {
  PosixProcessRunner ppr;
  auto cmr = ppr.run({"sh", "-c", "echo out; echo err >&2"});
  EXPECT_EQ(cmr.iExitCode, 0);
  EXPECT_EQ(cmr.sStdout, "out\n");
  EXPECT_EQ(cmr.sStderr, "err\n");
}

TEST(PosixProcessRunnerTest, ReportsExitCode) {
  PosixProcessRunner ppr;
  auto cmr = ppr.run({"sh", "-c", "exit 3"});
  EXPECT_EQ(cmr.iExitCode, 3);
  EXPECT_FALSE(cmr.ok());
}

TEST(PosixProcessRunnerTest, SignalledChildMapsTo128PlusSignal) {
  PosixProcessRunner ppr;
  auto cmr = ppr.run({"sh", "-c", "kill -TERM $$"});
  EXPECT_EQ(cmr.iExitCode, 128 + 15);
}

TEST(PosixProcessRunnerTest, MissingExecutableExits127) {
  PosixProcessRunner ppr;
  auto cmr = ppr.run({"cdp-no-such-binary-for-tests"});
  EXPECT_EQ(cmr.iExitCode, 127);
  EXPECT_NE(cmr.sStderr.find("execvp"), std::string::npos);
}

TEST(PosixProcessRunnerTest, SmallStdinIsDelivered) {
  PosixProcessRunner ppr;
  auto cmr = ppr.run({"cat"}, "hello");
  EXPECT_EQ(cmr.iExitCode, 0);
  EXPECT_EQ(cmr.sStdout, "hello");
}

TEST(PosixProcessRunnerTest, LargeStdinEchoedBackDoesNotDeadlock) {
  PosixProcessRunner ppr;
  const std::string sPayload(256 * 1024, 'x');
  auto cmr = ppr.run({"cat"}, sPayload);
  EXPECT_EQ(cmr.iExitCode, 0);
  EXPECT_EQ(cmr.sStdout.size(), sPayload.size());
  EXPECT_EQ(cmr.sStdout, sPayload);
}

TEST(PosixProcessRunnerTest, ChildIgnoringStdinStillCompletes) {
  PosixProcessRunner ppr;
  auto cmr = ppr.run({"true"}, std::string(256 * 1024, 'y'));
  EXPECT_EQ(cmr.iExitCode, 0);
}

TEST(PosixProcessRunnerTest, EmptyArgvThrows) {
  PosixProcessRunner ppr;
  EXPECT_THROW(ppr.run({}), std::invalid_argument);
}
