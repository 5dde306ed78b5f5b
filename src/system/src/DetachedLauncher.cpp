/**
 * @file DetachedLauncher.cpp
 * @brief systemd-run backed detached launcher.
 */

#include "src/system/inc/DetachedLauncher.hpp"
#include "src/system/inc/Command.hpp"

#include <cstdlib> // std::getenv

#include <fmt/core.h>

namespace rebind {

namespace system {

/* ----------------------------- Helpers ----------------------------- */

std::optional<std::string> processEnv(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

bool hasDetachedMarker(const EnvLookup& lookup) {
  const std::optional<std::string> VALUE = lookup(DETACHED_MARKER_ENV);
  return VALUE.has_value() && !VALUE->empty();
}

std::vector<std::string> buildSystemdRunArgv(const LaunchRequest& request) {
  std::vector<std::string> argv = {
      "systemd-run",
      "--no-ask-password",
      "--wait",
      "--collect",
      fmt::format("--unit={}", request.unitName),
      "--service-type=oneshot",
  };
  for (const auto& [name, value] : request.env) {
    argv.push_back(fmt::format("--setenv={}={}", name, value));
  }
  argv.emplace_back("--");
  argv.insert(argv.end(), request.command.begin(), request.command.end());
  return argv;
}

/* ----------------------------- SystemdRunLauncher ----------------------------- */

SystemdRunLauncher::SystemdRunLauncher(EnvLookup lookup)
    : lookup_(lookup ? std::move(lookup) : EnvLookup(processEnv)) {}

bool SystemdRunLauncher::isDetached() const { return hasDetachedMarker(lookup_); }

LaunchHandle SystemdRunLauncher::runDetached(const LaunchRequest& request) {
  LaunchHandle handle{};
  handle.unitName = request.unitName;
  if (request.command.empty()) {
    handle.detail = "empty command";
    return handle;
  }

  // Output goes to the unit's journal; the launcher's own status lines stay on our tty.
  const CommandResult RES = runCommand(buildSystemdRunArgv(request), OutputMode::Inherit);
  handle.launched = RES.launched;
  handle.exitCode = RES.exitCode;
  if (!RES.launched) {
    handle.detail = RES.summary();
  } else if (RES.exitCode != 0) {
    handle.detail = fmt::format("unit {} exited with status {}", request.unitName, RES.exitCode);
  }
  return handle;
}

} // namespace system

} // namespace rebind
