#ifndef REBIND_RESET_RESET_TYPES_HPP
#define REBIND_RESET_RESET_TYPES_HPP
/**
 * @file ResetTypes.hpp
 * @brief Shared vocabulary of a reset run: consumers, faults, outcomes.
 */

#include <sys/types.h> // pid_t

#include <cstdint> // std::uint8_t
#include <string>  // std::string

namespace rebind {

namespace reset {

/* ----------------------------- Consumers ----------------------------- */

/**
 * @brief How a consumer of the GPU is treated.
 *
 * Unknown means the command name could not be read; such processes are
 * reported but never signalled.
 */
enum class ConsumerClass : std::uint8_t { Compute = 0, DisplayServer = 1, Unknown = 2 };

/**
 * @brief Where a consumer record came from.
 */
enum class ConsumerSource : std::uint8_t {
  Management = 0, ///< GPU management interface (NVML / nvidia-smi)
  DrmCard = 1,    ///< Holder of a /dev/dri/cardN node owned by the driver
  DeviceNode = 2, ///< Holder of a /dev/nvidia* compute node
};

[[nodiscard]] const char* toString(ConsumerClass cls) noexcept;
[[nodiscard]] const char* toString(ConsumerSource source) noexcept;

/**
 * @brief One process bound to the target GPU.
 */
struct ConsumerRecord {
  pid_t pid{0};                                   ///< Host pid
  std::string processName;                        ///< comm; empty if unreadable
  std::string accessPath;                         ///< Node or interface through which it was seen
  ConsumerClass classification{ConsumerClass::Unknown};
  ConsumerSource source{ConsumerSource::Management};

  /// @brief "pid=1234 name=python class=Compute via=/dev/nvidia0 (Management)".
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Faults ----------------------------- */

/**
 * @brief Fault taxonomy.
 *
 * DetectionDegraded, StopFailure and RestoreFailure are absorbed and logged.
 * ReleaseFailure and ReacquireFailure end their phase and set the outcome.
 */
enum class FaultKind : std::uint8_t {
  DetectionDegraded = 0,
  StopFailure = 1,
  ReleaseFailure = 2,
  ReacquireFailure = 3,
  RestoreFailure = 4,
};

[[nodiscard]] const char* toString(FaultKind kind) noexcept;

/**
 * @brief One recorded fault.
 */
struct Fault {
  FaultKind kind{FaultKind::DetectionDegraded};
  std::string subject; ///< Service id, module name or detection source
  std::string detail;  ///< Diagnostic text

  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Outcome ----------------------------- */

/**
 * @brief Terminal result of a run.
 */
enum class RunOutcome : std::uint8_t {
  Success = 0,
  PartialUnloadFailure = 1, ///< A release failed; released units were rolled back
  ReloadFailure = 2,        ///< All units released but reacquire failed
  Aborted = 3,              ///< Escape launch failed or the run was interrupted
};

[[nodiscard]] const char* toString(RunOutcome outcome) noexcept;

/**
 * @brief Process exit code for an outcome (0 only for Success).
 */
[[nodiscard]] constexpr int toExitCode(RunOutcome outcome) noexcept {
  return static_cast<int>(outcome);
}

} // namespace reset

} // namespace rebind

#endif // REBIND_RESET_RESET_TYPES_HPP
