/**
 * @file RestorationController.cpp
 * @brief Reverse-order service restoration.
 */

#include "src/reset/inc/RestorationController.hpp"

#include <fmt/core.h>

namespace rebind {

namespace reset {

std::string recoveryCommand(const std::string& rootUnit, const std::string& displayService) {
  return fmt::format("modprobe {} && systemctl start {}", rootUnit, displayService);
}

RestorationReport RestorationController::restoreAll(const ServiceStopLedger& ledger,
                                                     const RestorationPolicy& policy) {
  RestorationReport report;
  const std::vector<std::string>& ENTRIES = ledger.entries();
  if (ENTRIES.empty()) {
    log_.debug("No services to restore");
    return report;
  }

  for (auto it = ENTRIES.rbegin(); it != ENTRIES.rend(); ++it) {
    const std::string& id = *it;

    if (policy.displayService && id == *policy.displayService && !policy.bindingIntact) {
      log_.warn("NVIDIA driver not loaded, skipping {} restart to avoid login loop", id);
      log_.warn("Run '{}' manually after fixing.", recoveryCommand(policy.rootUnit, id));
      report.withheld.push_back(id);
      continue;
    }

    log_.info("Restarting {}...", id);
    if (services_.start(id)) {
      report.restarted.push_back(id);
    } else {
      log_.warn("Failed to restart {}", id);
      report.failed.push_back(id);
      report.faults.push_back({FaultKind::RestoreFailure, id, "start failed"});
    }
  }
  return report;
}

} // namespace reset

} // namespace rebind
