/**
 * @file ProcessTable.cpp
 * @brief procfs-backed process table.
 */

#include "src/system/inc/ProcessTable.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <signal.h> // ::kill, SIGKILL
#include <unistd.h> // getpid, sysconf

#include <algorithm> // std::sort, std::replace
#include <cstdlib>   // std::strtod
#include <exception> // std::exception
#include <regex>     // std::regex, std::regex_search

namespace rebind {

namespace system {

namespace {

using rebind::helpers::files::listDirectory;
using rebind::helpers::files::readDirectory;
using rebind::helpers::files::readFile;
using rebind::helpers::files::readLink;
using rebind::helpers::strings::isAllDigits;
using rebind::helpers::strings::parseInt;

/// Index of starttime among the fields that follow the comm field.
constexpr std::size_t START_TIME_FIELD = 19;

} // namespace

/* ----------------------------- Parsing ----------------------------- */

std::optional<std::uint64_t> parseStartTicks(const std::string& statText) noexcept {
  const std::size_t CLOSE = statText.rfind(')');
  if (CLOSE == std::string::npos) {
    return std::nullopt;
  }
  std::string_view rest = std::string_view(statText).substr(CLOSE + 1);
  std::size_t field = 0;
  while (!rest.empty()) {
    const std::size_t START = rest.find_first_not_of(' ');
    if (START == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(START);
    const std::size_t END = rest.find(' ');
    const std::string_view TOKEN = rest.substr(0, END);
    if (field == START_TIME_FIELD) {
      const auto VALUE = parseInt(TOKEN);
      if (!VALUE || *VALUE < 0) {
        return std::nullopt;
      }
      return static_cast<std::uint64_t>(*VALUE);
    }
    ++field;
    if (END == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(END);
  }
  return std::nullopt;
}

/* ----------------------------- ProcfsProcessTable ----------------------------- */

ProcfsProcessTable::ProcfsProcessTable(std::string procRoot, pid_t selfPid)
    : procRoot_(std::move(procRoot)), selfPid_(selfPid != 0 ? selfPid : ::getpid()) {}

std::optional<std::vector<pid_t>> ProcfsProcessTable::listPids() const noexcept {
  const std::optional<std::vector<std::string>> ENTRIES = readDirectory(procRoot_);
  if (!ENTRIES) {
    return std::nullopt;
  }
  std::optional<std::vector<pid_t>> pids;
  try {
    pids.emplace();
    for (const std::string& entry : *ENTRIES) {
      if (!isAllDigits(entry)) {
        continue;
      }
      const auto PID = parseInt(entry);
      if (PID && *PID > 0) {
        pids->push_back(static_cast<pid_t>(*PID));
      }
    }
    std::sort(pids->begin(), pids->end());
  } catch (const std::exception&) {
    pids.reset();
  }
  return pids;
}

std::optional<std::string> ProcfsProcessTable::commandName(pid_t pid) {
  const std::optional<std::string> TEXT = readFile(pidPath(pid, "comm"));
  if (!TEXT) {
    return std::nullopt;
  }
  const std::string_view NAME = rebind::helpers::strings::trim(*TEXT);
  if (NAME.empty()) {
    return std::nullopt;
  }
  return std::string(NAME);
}

std::optional<std::string> ProcfsProcessTable::commandLine(pid_t pid) {
  std::optional<std::string> text = readFile(pidPath(pid, "cmdline"));
  if (!text) {
    return std::nullopt;
  }
  while (!text->empty() && text->back() == '\0') {
    text->pop_back();
  }
  std::replace(text->begin(), text->end(), '\0', ' ');
  return text;
}

std::optional<std::vector<pid_t>> ProcfsProcessTable::holders(const std::string& path) {
  const std::optional<std::vector<pid_t>> PIDS = listPids();
  if (!PIDS) {
    return std::nullopt;
  }
  std::vector<pid_t> out;
  for (const pid_t PID : *PIDS) {
    if (PID == selfPid_) {
      continue;
    }
    // Unreadable fd directories (exited or foreign processes) are skipped.
    const std::string FD_DIR = pidPath(PID, "fd");
    for (const std::string& fd : listDirectory(FD_DIR)) {
      const std::optional<std::string> TARGET = readLink(FD_DIR + "/" + fd);
      if (TARGET && *TARGET == path) {
        out.push_back(PID);
        break;
      }
    }
  }
  return out;
}

std::vector<pid_t> ProcfsProcessTable::matchCommandLine(const std::string& pattern) {
  std::vector<pid_t> out;
  std::regex re;
  try {
    re = std::regex(pattern, std::regex::ECMAScript);
  } catch (const std::regex_error&) {
    return out;
  }
  const std::optional<std::vector<pid_t>> PIDS = listPids();
  if (!PIDS) {
    return out;
  }
  for (const pid_t PID : *PIDS) {
    if (PID == selfPid_) {
      continue;
    }
    const std::optional<std::string> CMD = commandLine(PID);
    if (CMD && !CMD->empty() && std::regex_search(*CMD, re)) {
      out.push_back(PID);
    }
  }
  return out;
}

bool ProcfsProcessTable::kill(pid_t pid) {
  if (pid <= 0 || pid == selfPid_) {
    return false;
  }
  return ::kill(pid, SIGKILL) == 0;
}

std::optional<std::uint64_t> ProcfsProcessTable::elapsedSeconds(pid_t pid) const noexcept {
  std::optional<std::string> statText;
  std::optional<std::string> uptimeText;
  try {
    statText = readFile(pidPath(pid, "stat"));
    uptimeText = readFile(procRoot_ + "/uptime");
  } catch (const std::exception&) {
    return std::nullopt;
  }
  if (!statText || !uptimeText) {
    return std::nullopt;
  }
  const std::optional<std::uint64_t> START = parseStartTicks(*statText);
  const long TICKS_PER_SEC = ::sysconf(_SC_CLK_TCK);
  if (!START || TICKS_PER_SEC <= 0) {
    return std::nullopt;
  }
  const double UP = std::strtod(uptimeText->c_str(), nullptr);
  const double STARTED = static_cast<double>(*START) / static_cast<double>(TICKS_PER_SEC);
  if (UP < STARTED) {
    return 0;
  }
  return static_cast<std::uint64_t>(UP - STARTED);
}

std::string ProcfsProcessTable::pidPath(pid_t pid, const char* leaf) const {
  return procRoot_ + "/" + std::to_string(pid) + "/" + leaf;
}

} // namespace system

} // namespace rebind
