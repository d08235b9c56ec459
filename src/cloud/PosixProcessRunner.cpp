#include "cloud/PosixProcessRunner.hpp"

#include "common/Logger.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cdp::cloud {

namespace {

constexpr int kChildErrorExit = 127;
constexpr int kSignalExitBase = 128;
constexpr size_t kReadChunk = 4096;

/// Owns one pipe end; closes it on destruction.
class FdGuard {
 public:
  explicit FdGuard(int iFd = -1) : _iFd(iFd) {}
  ~FdGuard() { reset(); }

  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;

  int get() const { return _iFd; }

  void reset(int iNewFd = -1) {
    if (_iFd != -1) {
      for (int iAttempt = 0; iAttempt < 3 && ::close(_iFd) == -1; ++iAttempt) {
        if (errno != EINTR) break;
      }
    }
    _iFd = iNewFd;
  }

 private:
  int _iFd;
};

struct PipePair {
  FdGuard fgRead;
  FdGuard fgWrite;
};

void openPipe(PipePair& pp) {
  int aFds[2];
  if (::pipe(aFds) == -1) {
    throw std::system_error(errno, std::generic_category(), "pipe failed");
  }
  ::fcntl(aFds[0], F_SETFD, FD_CLOEXEC);
  ::fcntl(aFds[1], F_SETFD, FD_CLOEXEC);
  pp.fgRead.reset(aFds[0]);
  pp.fgWrite.reset(aFds[1]);
}

/// POLLOUT only reports some free space in the pipe, so writes to the
/// child's stdin must never block while its stdout is still undrained.
void setNonBlocking(int iFd) {
  const int iFlags = ::fcntl(iFd, F_GETFL);
  if (iFlags == -1 || ::fcntl(iFd, F_SETFL, iFlags | O_NONBLOCK) == -1) {
    throw std::system_error(errno, std::generic_category(), "fcntl failed");
  }
}

[[noreturn]] void execChild(PipePair& ppIn, PipePair& ppOut, PipePair& ppErr,
                            const std::vector<std::string>& vArgv) {
  if (::dup2(ppIn.fgRead.get(), STDIN_FILENO) == -1 ||
      ::dup2(ppOut.fgWrite.get(), STDOUT_FILENO) == -1 ||
      ::dup2(ppErr.fgWrite.get(), STDERR_FILENO) == -1) {
    std::perror("dup2");
    _exit(kChildErrorExit);
  }

  std::vector<char*> vArgs;
  vArgs.reserve(vArgv.size() + 1);
  for (const auto& sArg : vArgv) {
    vArgs.push_back(const_cast<char*>(sArg.c_str()));
  }
  vArgs.push_back(nullptr);

  ::execvp(vArgs[0], vArgs.data());
  std::perror("execvp");
  _exit(kChildErrorExit);
}

int waitForChild(pid_t pid) {
  int iStatus = 0;
  while (::waitpid(pid, &iStatus, 0) == -1) {
    if (errno != EINTR) {
      throw std::system_error(errno, std::generic_category(), "waitpid failed");
    }
  }
  if (WIFEXITED(iStatus)) return WEXITSTATUS(iStatus);
  if (WIFSIGNALED(iStatus)) return kSignalExitBase + WTERMSIG(iStatus);
  return iStatus;
}

/// Feed stdin and drain stdout/stderr until both output pipes close.
void pumpPipes(PipePair& ppIn, PipePair& ppOut, PipePair& ppErr, const std::string& sStdin,
               common::CommandResult& cmr) {
  size_t nWritten = 0;
  if (sStdin.empty()) {
    ppIn.fgWrite.reset();
  }

  std::array<char, kReadChunk> aChunk{};
  while (ppOut.fgRead.get() != -1 || ppErr.fgRead.get() != -1) {
    std::array<pollfd, 3> aPoll{};
    aPoll[0] = {ppIn.fgWrite.get(), POLLOUT, 0};
    aPoll[1] = {ppOut.fgRead.get(), POLLIN, 0};
    aPoll[2] = {ppErr.fgRead.get(), POLLIN, 0};

    if (::poll(aPoll.data(), aPoll.size(), -1) == -1) {
      if (errno == EINTR) continue;
      throw std::system_error(errno, std::generic_category(), "poll failed");
    }

    if (aPoll[0].fd != -1 && aPoll[0].revents != 0) {
      if (aPoll[0].revents & POLLOUT) {
        ssize_t iRet = ::write(ppIn.fgWrite.get(), sStdin.data() + nWritten,
                               sStdin.size() - nWritten);
        if (iRet > 0) nWritten += static_cast<size_t>(iRet);
        if (iRet == -1 && errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
          ppIn.fgWrite.reset();  // child closed stdin early
        }
      } else {
        ppIn.fgWrite.reset();
      }
      if (nWritten == sStdin.size()) {
        ppIn.fgWrite.reset();
      }
    }

    for (size_t i = 1; i < aPoll.size(); ++i) {
      if (aPoll[i].fd == -1 || aPoll[i].revents == 0) continue;
      FdGuard& fg = (i == 1) ? ppOut.fgRead : ppErr.fgRead;
      std::string& sSink = (i == 1) ? cmr.sStdout : cmr.sStderr;

      ssize_t iRead = ::read(fg.get(), aChunk.data(), aChunk.size());
      if (iRead == -1) {
        if (errno == EINTR) continue;
        throw std::system_error(errno, std::generic_category(), "read failed");
      }
      if (iRead == 0) {
        fg.reset();
        continue;
      }
      sSink.append(aChunk.data(), static_cast<size_t>(iRead));
    }
  }
  ppIn.fgWrite.reset();
}

}  // namespace

PosixProcessRunner::PosixProcessRunner() {
  // A child that exits before reading stdin must not kill the orchestrator.
  std::signal(SIGPIPE, SIG_IGN);
}

PosixProcessRunner::~PosixProcessRunner() = default;

common::CommandResult PosixProcessRunner::run(const std::vector<std::string>& vArgv,
                                              const std::string& sStdin) {
  if (vArgv.empty()) {
    throw std::invalid_argument("PosixProcessRunner::run: argv must be non-empty");
  }

  PipePair ppIn;
  PipePair ppOut;
  PipePair ppErr;
  openPipe(ppIn);
  openPipe(ppOut);
  openPipe(ppErr);

  auto spLog = common::Logger::get();
  spLog->debug("exec: {}", vArgv.front() + (vArgv.size() > 1 ? " " + vArgv[1] : ""));

  const pid_t pid = ::fork();
  if (pid == -1) {
    throw std::system_error(errno, std::generic_category(), "fork failed");
  }
  if (pid == 0) {
    execChild(ppIn, ppOut, ppErr, vArgv);
  }

  // Parent keeps the write end of stdin and the read ends of stdout/stderr
  ppIn.fgRead.reset();
  ppOut.fgWrite.reset();
  ppErr.fgWrite.reset();

  common::CommandResult cmr;
  try {
    setNonBlocking(ppIn.fgWrite.get());
    pumpPipes(ppIn, ppOut, ppErr, sStdin, cmr);
  } catch (const std::system_error&) {
    ::kill(pid, SIGKILL);
    waitForChild(pid);
    throw;
  }
  cmr.iExitCode = waitForChild(pid);

  return cmr;
}

}  // namespace cdp::cloud
