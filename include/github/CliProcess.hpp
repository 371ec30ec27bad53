#pragma once

#include <string>
#include <vector>

namespace gov::github {

/// Captured result of a child process.
/// Class abbreviation: pres
struct ProcessResult {
  int iExitCode = -1;
  std::string sStdout;
  std::string sStderr;
};

/// Run vArgs[0] (resolved through PATH) with vArgs as argv, feeding sStdin to
/// its standard input and capturing stdout/stderr until it exits.
/// sWorkDir, when non-empty, is the child's working directory.
/// iExitCode is 127 when the program could not be executed and -1 when the
/// child could not be started or was killed by a signal.
ProcessResult runProcess(const std::vector<std::string>& vArgs, const std::string& sStdin,
                         const std::string& sWorkDir);

}  // namespace gov::github
