/**
 * @file ProcessReaper.cpp
 * @brief SIGKILL of compute consumers and watcher loops.
 */

#include "src/reset/inc/ProcessReaper.hpp"

#include <algorithm> // std::find

namespace rebind {

namespace reset {

void ProcessReaper::killOne(pid_t pid, const std::string& name, ReapReport& report) {
  if (std::find(report.killed.begin(), report.killed.end(), pid) != report.killed.end()) {
    return;
  }
  log_.info("Killing pid {} ({})", pid, name.empty() ? "?" : name);
  if (processes_.kill(pid)) {
    report.killed.push_back(pid);
  } else {
    log_.warn("Could not signal pid {}", pid);
    report.failed.push_back(pid);
  }
}

ReapReport ProcessReaper::reap(const std::vector<ConsumerRecord>& consumers) {
  ReapReport report;
  for (const ConsumerRecord& rec : consumers) {
    switch (rec.classification) {
    case ConsumerClass::Compute:
      killOne(rec.pid, rec.processName, report);
      break;
    case ConsumerClass::DisplayServer:
      log_.info("Sparing display server pid {} ({})", rec.pid, rec.processName);
      report.spared.push_back(rec.pid);
      break;
    case ConsumerClass::Unknown:
      log_.warn("Sparing pid {}: command name unreadable", rec.pid);
      report.spared.push_back(rec.pid);
      break;
    }
  }
  return report;
}

ReapReport ProcessReaper::reapWatchers(const std::vector<std::string>& patterns) {
  ReapReport report;
  for (const std::string& pattern : patterns) {
    for (const pid_t PID : processes_.matchCommandLine(pattern)) {
      const std::optional<std::string> NAME = processes_.commandName(PID);
      if (NAME && classifier_.isDisplayServer(*NAME)) {
        report.spared.push_back(PID);
        continue;
      }
      killOne(PID, NAME.value_or(std::string{}), report);
    }
  }
  return report;
}

} // namespace reset

} // namespace rebind
