/**
 * @file ServiceLedger.cpp
 * @brief Service stop ledger.
 */

#include "src/reset/inc/ServiceLedger.hpp"

#include <algorithm> // std::find

namespace rebind {

namespace reset {

const char* toString(StopResult result) noexcept {
  switch (result) {
  case StopResult::Stopped:
    return "Stopped";
  case StopResult::Skipped:
    return "Skipped";
  case StopResult::Failed:
    return "Failed";
  }
  return "Unknown";
}

bool ServiceStopLedger::contains(const std::string& id) const noexcept {
  return std::find(entries_.begin(), entries_.end(), id) != entries_.end();
}

StopResult ServiceStopLedger::stopIfRunning(const std::string& id) {
  if (contains(id)) {
    log_.debug("{} already stopped by this run", id);
    return StopResult::Skipped;
  }
  if (!services_.isActive(id)) {
    log_.info("{} not running, skipping", id);
    return StopResult::Skipped;
  }

  log_.info("Stopping {}...", id);
  if (!services_.stop(id)) {
    log_.warn("Failed to stop {}", id);
    return StopResult::Failed;
  }
  entries_.push_back(id);
  return StopResult::Stopped;
}

} // namespace reset

} // namespace rebind
