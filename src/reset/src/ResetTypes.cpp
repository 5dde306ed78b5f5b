/**
 * @file ResetTypes.cpp
 * @brief String conversions for reset vocabulary types.
 */

#include "src/reset/inc/ResetTypes.hpp"

#include <fmt/core.h>

namespace rebind {

namespace reset {

/* ----------------------------- Enums ----------------------------- */

const char* toString(ConsumerClass cls) noexcept {
  switch (cls) {
  case ConsumerClass::Compute:
    return "Compute";
  case ConsumerClass::DisplayServer:
    return "DisplayServer";
  case ConsumerClass::Unknown:
    return "Unknown";
  }
  return "Unknown";
}

const char* toString(ConsumerSource source) noexcept {
  switch (source) {
  case ConsumerSource::Management:
    return "Management";
  case ConsumerSource::DrmCard:
    return "DrmCard";
  case ConsumerSource::DeviceNode:
    return "DeviceNode";
  }
  return "Unknown";
}

const char* toString(FaultKind kind) noexcept {
  switch (kind) {
  case FaultKind::DetectionDegraded:
    return "DetectionDegraded";
  case FaultKind::StopFailure:
    return "StopFailure";
  case FaultKind::ReleaseFailure:
    return "ReleaseFailure";
  case FaultKind::ReacquireFailure:
    return "ReacquireFailure";
  case FaultKind::RestoreFailure:
    return "RestoreFailure";
  }
  return "Unknown";
}

const char* toString(RunOutcome outcome) noexcept {
  switch (outcome) {
  case RunOutcome::Success:
    return "Success";
  case RunOutcome::PartialUnloadFailure:
    return "PartialUnloadFailure";
  case RunOutcome::ReloadFailure:
    return "ReloadFailure";
  case RunOutcome::Aborted:
    return "Aborted";
  }
  return "Unknown";
}

/* ----------------------------- Records ----------------------------- */

std::string ConsumerRecord::toString() const {
  return fmt::format("pid={} name={} class={} via={} ({})", pid,
                     processName.empty() ? "?" : processName, reset::toString(classification),
                     accessPath, reset::toString(source));
}

std::string Fault::toString() const {
  if (detail.empty()) {
    return fmt::format("{}: {}", reset::toString(kind), subject);
  }
  return fmt::format("{}: {} ({})", reset::toString(kind), subject, detail);
}

} // namespace reset

} // namespace rebind
