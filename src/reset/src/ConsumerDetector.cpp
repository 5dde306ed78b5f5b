/**
 * @file ConsumerDetector.cpp
 * @brief Consumer detection and classification.
 */

#include "src/reset/inc/ConsumerDetector.hpp"

#include <algorithm> // std::any_of
#include <exception> // std::exception
#include <utility>   // std::move

#include <fmt/core.h>

namespace rebind {

namespace reset {

/* ----------------------------- ConsumerClassifier ----------------------------- */

ConsumerClassifier::ConsumerClassifier(const std::string& displayPattern) {
  try {
    pattern_ = std::regex(displayPattern, std::regex::ECMAScript);
    valid_ = true;
  } catch (const std::regex_error&) {
    valid_ = false;
  }
}

bool ConsumerClassifier::isDisplayServer(const std::string& name) const noexcept {
  if (!valid_ || name.empty()) {
    return false;
  }
  try {
    return std::regex_match(name, pattern_);
  } catch (const std::exception&) {
    return false;
  }
}

ConsumerClass ConsumerClassifier::classify(const std::optional<std::string>& name) const noexcept {
  if (!name || name->empty()) {
    return ConsumerClass::Unknown;
  }
  return isDisplayServer(*name) ? ConsumerClass::DisplayServer : ConsumerClass::Compute;
}

/* ----------------------------- DetectionResult ----------------------------- */

bool DetectionResult::hasDisplayServer() const noexcept {
  return std::any_of(consumers.begin(), consumers.end(), [](const ConsumerRecord& rec) {
    return rec.classification == ConsumerClass::DisplayServer;
  });
}

/* ----------------------------- ConsumerDetector ----------------------------- */

void ConsumerDetector::add(DetectionResult& result, ConsumerRecord record) {
  for (const ConsumerRecord& existing : result.consumers) {
    if (existing.pid == record.pid) {
      log_.debug("  pid {} already seen via {}", record.pid, toString(existing.source));
      return;
    }
  }
  log_.info("  consumer: {}", record.toString());
  result.consumers.push_back(std::move(record));
}

DetectionResult ConsumerDetector::detect(const gpu::GpuTarget& target,
                                         const gpu::DeviceSurface& surface) {
  DetectionResult result;
  log_.info("Detecting consumers of {}", target.toString());

  // Management interface
  const std::string MGMT_PATH = target.deviceMinor
                                    ? fmt::format("/dev/nvidia{}", *target.deviceMinor)
                                    : std::string(gpu_.name());
  const auto PROCS = gpu_.computeProcesses(target);
  if (!PROCS) {
    log_.warn("  {} unavailable, compute process list skipped", gpu_.name());
    result.faults.push_back({FaultKind::DetectionDegraded, gpu_.name(), "compute process query failed"});
  } else {
    for (const gpu::GpuProcess& proc : *PROCS) {
      const std::optional<std::string> NAME = processes_.commandName(proc.pid);
      ConsumerRecord rec{};
      rec.pid = proc.pid;
      rec.processName = NAME.value_or(std::string{});
      rec.accessPath = MGMT_PATH;
      rec.classification = classifier_.classify(NAME);
      rec.source = ConsumerSource::Management;
      add(result, std::move(rec));
    }
  }

  // DRM card holders: display servers only
  if (surface.drmCards.empty()) {
    log_.debug("  no DRM card nodes owned by {}", gpu::NVIDIA_DRIVER);
  }
  for (const std::string& card : surface.drmCards) {
    const std::optional<std::vector<pid_t>> HOLDERS = processes_.holders(card);
    if (!HOLDERS) {
      log_.warn("  cannot scan holders of {}, display server check skipped", card);
      result.faults.push_back({FaultKind::DetectionDegraded, "drm", card + ": process list unreadable"});
      continue;
    }
    for (const pid_t PID : *HOLDERS) {
      const std::optional<std::string> NAME = processes_.commandName(PID);
      if (!NAME || !classifier_.isDisplayServer(*NAME)) {
        continue;
      }
      ConsumerRecord rec{};
      rec.pid = PID;
      rec.processName = *NAME;
      rec.accessPath = card;
      rec.classification = ConsumerClass::DisplayServer;
      rec.source = ConsumerSource::DrmCard;
      add(result, std::move(rec));
    }
  }

  // Compute device node holders
  for (const std::string& node : surface.computeNodes) {
    const std::optional<std::vector<pid_t>> HOLDERS = processes_.holders(node);
    if (!HOLDERS) {
      log_.warn("  cannot scan holders of {}, device node check skipped", node);
      result.faults.push_back(
          {FaultKind::DetectionDegraded, "device-node", node + ": process list unreadable"});
      continue;
    }
    for (const pid_t PID : *HOLDERS) {
      const std::optional<std::string> NAME = processes_.commandName(PID);
      ConsumerRecord rec{};
      rec.pid = PID;
      rec.processName = NAME.value_or(std::string{});
      rec.accessPath = node;
      rec.classification = classifier_.classify(NAME);
      rec.source = ConsumerSource::DeviceNode;
      add(result, std::move(rec));
    }
  }

  if (result.consumers.empty()) {
    log_.info("  no consumers found");
  }
  return result;
}

} // namespace reset

} // namespace rebind
