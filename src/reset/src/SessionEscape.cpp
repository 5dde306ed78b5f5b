/**
 * @file SessionEscape.cpp
 * @brief Detach-before-stop supervisor.
 */

#include "src/reset/inc/SessionEscape.hpp"

namespace rebind {

namespace reset {

const char* toString(EscapeDecision decision) noexcept {
  switch (decision) {
  case EscapeDecision::NotNeeded:
    return "NotNeeded";
  case EscapeDecision::AlreadyDetached:
    return "AlreadyDetached";
  case EscapeDecision::Relaunched:
    return "Relaunched";
  case EscapeDecision::LaunchFailed:
    return "LaunchFailed";
  }
  return "Unknown";
}

EscapeResult SessionEscape::ensureDetached(bool stopsSessionService,
                                           const system::LaunchRequest& request) {
  EscapeResult result;
  if (!stopsSessionService) {
    result.decision = EscapeDecision::NotNeeded;
    return result;
  }
  if (launcher_.isDetached()) {
    log_.debug("Already running outside the login session");
    result.decision = EscapeDecision::AlreadyDetached;
    return result;
  }

  log_.info("Re-launching via systemd-run to survive display manager stop...");
  const system::LaunchHandle HANDLE = launcher_.runDetached(request);
  if (!HANDLE.launched) {
    log_.error("Could not launch {}: {}", request.unitName, HANDLE.detail);
    result.decision = EscapeDecision::LaunchFailed;
    result.detail = HANDLE.detail;
    return result;
  }

  log_.info("Detached run {} finished with status {}", HANDLE.unitName, HANDLE.exitCode);
  result.decision = EscapeDecision::Relaunched;
  result.exitCode = HANDLE.exitCode;
  result.detail = HANDLE.detail;
  return result;
}

} // namespace reset

} // namespace rebind
