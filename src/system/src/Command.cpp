/**
 * @file Command.cpp
 * @brief fork/exec command runner with output capture.
 *
 * Exec failure is reported through a close-on-exec pipe carrying the child's
 * errno, so "program not found" is distinguishable from "program exited 127".
 */

#include "src/system/inc/Command.hpp"
#include "src/helpers/inc/Files.hpp"

#include <fcntl.h>    // open, O_WRONLY, O_CLOEXEC
#include <sys/wait.h> // waitpid, WIFEXITED
#include <unistd.h>   // fork, execvp, pipe2, dup2, _exit

#include <array>   // std::array
#include <cerrno>  // errno
#include <cstring> // std::strerror
#include <exception> // std::exception

#include <fmt/core.h>

namespace rebind {

namespace system {

namespace {

/// Build a NULL-terminated argv array pointing into the string vector.
std::vector<char*> toArgv(const std::vector<std::string>& argv) {
  std::vector<char*> out;
  out.reserve(argv.size() + 1);
  for (const std::string& arg : argv) {
    out.push_back(const_cast<char*>(arg.c_str()));
  }
  out.push_back(nullptr);
  return out;
}

/// Read a descriptor to EOF, retrying on EINTR.
void drain(int fd, std::string& out) noexcept {
  std::array<char, 4096> buf{};
  for (;;) {
    const ssize_t N = ::read(fd, buf.data(), buf.size());
    if (N > 0) {
      try {
        out.append(buf.data(), static_cast<std::size_t>(N));
      } catch (const std::exception&) {
        return;
      }
      continue;
    }
    if (N < 0 && errno == EINTR) {
      continue;
    }
    return;
  }
}

/// Wait for a child, retrying on EINTR. Returns the raw wait status or -1.
int waitChild(pid_t pid) noexcept {
  int status = 0;
  for (;;) {
    const pid_t RC = ::waitpid(pid, &status, 0);
    if (RC == pid) {
      return status;
    }
    if (RC < 0 && errno == EINTR) {
      continue;
    }
    return -1;
  }
}

} // namespace

/* ----------------------------- CommandResult ----------------------------- */

std::string CommandResult::summary() const {
  if (!launched) {
    return fmt::format("exec failed: {}", std::strerror(execErrno));
  }
  const std::size_t NL = output.find('\n');
  return output.substr(0, NL);
}

/* ----------------------------- API ----------------------------- */

CommandResult runCommand(const std::vector<std::string>& argv, OutputMode mode) noexcept {
  CommandResult result{};
  if (argv.empty()) {
    result.execErrno = EINVAL;
    return result;
  }

  std::vector<char*> cargv;
  try {
    cargv = toArgv(argv);
  } catch (const std::exception&) {
    result.execErrno = ENOMEM;
    return result;
  }

  int outPipe[2] = {-1, -1};
  int errPipe[2] = {-1, -1};
  if (mode == OutputMode::Capture && ::pipe2(outPipe, O_CLOEXEC) != 0) {
    result.execErrno = errno;
    return result;
  }
  if (::pipe2(errPipe, O_CLOEXEC) != 0) {
    result.execErrno = errno;
    if (outPipe[0] >= 0) {
      ::close(outPipe[0]);
      ::close(outPipe[1]);
    }
    return result;
  }

  const pid_t PID = ::fork();
  if (PID < 0) {
    result.execErrno = errno;
    for (int fd : {outPipe[0], outPipe[1], errPipe[0], errPipe[1]}) {
      if (fd >= 0) {
        ::close(fd);
      }
    }
    return result;
  }

  if (PID == 0) {
    // Child: only async-signal-safe calls from here on.
    if (mode == OutputMode::Capture) {
      ::dup2(outPipe[1], STDOUT_FILENO);
      ::dup2(outPipe[1], STDERR_FILENO);
    } else if (mode == OutputMode::Discard) {
      const int NUL = ::open("/dev/null", O_WRONLY);
      if (NUL >= 0) {
        ::dup2(NUL, STDOUT_FILENO);
        ::dup2(NUL, STDERR_FILENO);
      }
    }
    ::execvp(cargv[0], cargv.data());
    const int ERR = errno;
    [[maybe_unused]] const ssize_t W = ::write(errPipe[1], &ERR, sizeof(ERR));
    ::_exit(127);
  }

  // Parent
  ::close(errPipe[1]);
  if (mode == OutputMode::Capture) {
    ::close(outPipe[1]);
    drain(outPipe[0], result.output);
    ::close(outPipe[0]);
  }

  int childErrno = 0;
  ssize_t n = 0;
  do {
    n = ::read(errPipe[0], &childErrno, sizeof(childErrno));
  } while (n < 0 && errno == EINTR);
  ::close(errPipe[0]);

  const int STATUS = waitChild(PID);

  if (n == static_cast<ssize_t>(sizeof(childErrno))) {
    result.launched = false;
    result.execErrno = childErrno;
    return result;
  }

  result.launched = true;
  if (STATUS < 0) {
    result.exitCode = -1;
  } else if (WIFEXITED(STATUS)) {
    result.exitCode = WEXITSTATUS(STATUS);
  } else if (WIFSIGNALED(STATUS)) {
    result.exitCode = 128 + WTERMSIG(STATUS);
  }
  return result;
}

int execReplace(const std::vector<std::string>& argv) noexcept {
  if (argv.empty()) {
    return EINVAL;
  }
  try {
    std::vector<char*> cargv = toArgv(argv);
    ::execvp(cargv[0], cargv.data());
  } catch (const std::exception&) {
    return ENOMEM;
  }
  return errno;
}

std::string selfExecutablePath() noexcept {
  return rebind::helpers::files::readLink("/proc/self/exe").value_or(std::string{});
}

} // namespace system

} // namespace rebind
