#include "github/CliProcess.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace gov::github {

namespace {

void closeFd(int& iFd) {
  if (iFd >= 0) {
    close(iFd);
    iFd = -1;
  }
}

void ignoreSigpipeOnce() {
  static std::once_flag flag;
  // A child that exits before reading all of stdin must not kill us.
  std::call_once(flag, []() { std::signal(SIGPIPE, SIG_IGN); });
}

}  // namespace

ProcessResult runProcess(const std::vector<std::string>& vArgs, const std::string& sStdin,
                         const std::string& sWorkDir) {
  ProcessResult pres;
  if (vArgs.empty()) {
    pres.sStderr = "no command given";
    return pres;
  }

  ignoreSigpipeOnce();

  int aStdin[2] = {-1, -1};
  int aStdout[2] = {-1, -1};
  int aStderr[2] = {-1, -1};
  // Close-on-exec keeps these ends out of children spawned by other workers
  if (pipe2(aStdin, O_CLOEXEC) != 0 || pipe2(aStdout, O_CLOEXEC) != 0 ||
      pipe2(aStderr, O_CLOEXEC) != 0) {
    pres.sStderr = std::string("pipe2() failed: ") + std::strerror(errno);
    for (int* pFd : {&aStdin[0], &aStdin[1], &aStdout[0], &aStdout[1], &aStderr[0], &aStderr[1]}) {
      closeFd(*pFd);
    }
    return pres;
  }

  // Built before fork(): the child must not allocate
  std::vector<char*> vArgv;
  vArgv.reserve(vArgs.size() + 1);
  for (const auto& sArg : vArgs) {
    vArgv.push_back(const_cast<char*>(sArg.c_str()));
  }
  vArgv.push_back(nullptr);

  pid_t pid = fork();
  if (pid < 0) {
    pres.sStderr = std::string("fork() failed: ") + std::strerror(errno);
    for (int* pFd : {&aStdin[0], &aStdin[1], &aStdout[0], &aStdout[1], &aStderr[0], &aStderr[1]}) {
      closeFd(*pFd);
    }
    return pres;
  }

  if (pid == 0) {
    // Child process
    dup2(aStdin[0], STDIN_FILENO);
    dup2(aStdout[1], STDOUT_FILENO);
    dup2(aStderr[1], STDERR_FILENO);
    close(aStdin[0]);
    close(aStdin[1]);
    close(aStdout[0]);
    close(aStdout[1]);
    close(aStderr[0]);
    close(aStderr[1]);

    if (!sWorkDir.empty() && chdir(sWorkDir.c_str()) != 0) {
      _exit(127);
    }

    execvp(vArgv[0], vArgv.data());
    _exit(127);
  }

  // Parent process
  closeFd(aStdin[0]);
  closeFd(aStdout[1]);
  closeFd(aStderr[1]);

  int iStdinFd = aStdin[1];
  int iStdoutFd = aStdout[0];
  int iStderrFd = aStderr[0];
  if (sStdin.empty()) {
    closeFd(iStdinFd);
  } else {
    fcntl(iStdinFd, F_SETFL, fcntl(iStdinFd, F_GETFL) | O_NONBLOCK);
  }

  size_t nWritten = 0;
  char aBuf[4096];

  while (iStdinFd >= 0 || iStdoutFd >= 0 || iStderrFd >= 0) {
    pollfd aPoll[3];
    nfds_t nCount = 0;
    if (iStdinFd >= 0) aPoll[nCount++] = {iStdinFd, POLLOUT, 0};
    if (iStdoutFd >= 0) aPoll[nCount++] = {iStdoutFd, POLLIN, 0};
    if (iStderrFd >= 0) aPoll[nCount++] = {iStderrFd, POLLIN, 0};

    if (poll(aPoll, nCount, -1) < 0) {
      if (errno == EINTR) continue;
      break;
    }

    for (nfds_t i = 0; i < nCount; ++i) {
      const short iRevents = aPoll[i].revents;
      if (iRevents == 0) continue;

      if (aPoll[i].fd == iStdinFd) {
        ssize_t n = write(iStdinFd, sStdin.data() + nWritten, sStdin.size() - nWritten);
        if (n > 0) {
          nWritten += static_cast<size_t>(n);
        }
        if (nWritten >= sStdin.size() || (n < 0 && errno != EAGAIN && errno != EINTR)) {
          closeFd(iStdinFd);
        }
        continue;
      }

      int& iReadFd = (aPoll[i].fd == iStdoutFd) ? iStdoutFd : iStderrFd;
      std::string& sTarget = (aPoll[i].fd == iStdoutFd) ? pres.sStdout : pres.sStderr;
      ssize_t n = read(iReadFd, aBuf, sizeof(aBuf));
      if (n > 0) {
        sTarget.append(aBuf, static_cast<size_t>(n));
      } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
        closeFd(iReadFd);
      }
    }
  }

  closeFd(iStdinFd);
  closeFd(iStdoutFd);
  closeFd(iStderrFd);

  int iStatus = 0;
  while (waitpid(pid, &iStatus, 0) < 0) {
    if (errno != EINTR) {
      return pres;
    }
  }
  if (WIFEXITED(iStatus)) {
    pres.iExitCode = WEXITSTATUS(iStatus);
  }
  return pres;
}

}  // namespace gov::github
