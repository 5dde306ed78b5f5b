#ifndef REBIND_SYSTEM_DETACHED_LAUNCHER_HPP
#define REBIND_SYSTEM_DETACHED_LAUNCHER_HPP
/**
 * @file DetachedLauncher.hpp
 * @brief Run a command outside the caller's login session.
 * @note Linux-only. The production launcher uses `systemd-run` transient units.
 *
 * A process started by systemd as part of any unit carries a non-empty
 * INVOCATION_ID in its environment. That variable is the "already detached"
 * marker: a relaunched run sees it and does not relaunch again.
 */

#include <functional> // std::function
#include <optional>   // std::optional
#include <string>     // std::string
#include <utility>    // std::pair
#include <vector>     // std::vector

namespace rebind {

namespace system {

/* ----------------------------- Constants ----------------------------- */

/// Environment variable systemd sets for every unit it starts.
inline constexpr const char* DETACHED_MARKER_ENV = "INVOCATION_ID";

/* ----------------------------- Types ----------------------------- */

/// Environment lookup; returns nullopt when the variable is unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/**
 * @brief What to launch detached.
 */
struct LaunchRequest {
  std::string unitName;                                  ///< Transient unit name, e.g. "gpu-reset-1700000000"
  std::vector<std::string> command;                      ///< argv of the relaunched run
  std::vector<std::pair<std::string, std::string>> env;  ///< Variables forwarded into the unit
};

/**
 * @brief Result of a detached launch.
 */
struct LaunchHandle {
  bool launched{false}; ///< False if the launcher itself could not be executed
  std::string unitName; ///< Unit that ran the command
  int exitCode{-1};     ///< Launcher exit status (the relaunched run's status for oneshot units)
  std::string detail;   ///< Diagnostic text on failure
};

/* ----------------------------- DetachedLauncher ----------------------------- */

/**
 * @brief Detached-execution interface.
 */
class DetachedLauncher {
public:
  virtual ~DetachedLauncher() = default;

  /// True if the current process already runs outside a login session.
  [[nodiscard]] virtual bool isDetached() const = 0;

  /// Launch and wait for the detached command.
  [[nodiscard]] virtual LaunchHandle runDetached(const LaunchRequest& request) = 0;
};

/**
 * @brief DetachedLauncher backed by `systemd-run --service-type=oneshot`.
 */
class SystemdRunLauncher final : public DetachedLauncher {
public:
  /// @param lookup Environment lookup (tests inject one); defaults to getenv.
  explicit SystemdRunLauncher(EnvLookup lookup = {});

  [[nodiscard]] bool isDetached() const override;
  [[nodiscard]] LaunchHandle runDetached(const LaunchRequest& request) override;

private:
  EnvLookup lookup_;
};

/* ----------------------------- Helpers ----------------------------- */

/// getenv-backed lookup.
[[nodiscard]] std::optional<std::string> processEnv(const std::string& name);

/// True if the marker variable is set and non-empty.
[[nodiscard]] bool hasDetachedMarker(const EnvLookup& lookup);

/**
 * @brief Build the systemd-run argv for a request.
 *
 * Example:
 *   systemd-run --no-ask-password --wait --collect --unit=gpu-reset-42
 *     --service-type=oneshot --setenv=TS=42 -- /usr/bin/gpu-reset
 */
[[nodiscard]] std::vector<std::string> buildSystemdRunArgv(const LaunchRequest& request);

} // namespace system

} // namespace rebind

#endif // REBIND_SYSTEM_DETACHED_LAUNCHER_HPP
