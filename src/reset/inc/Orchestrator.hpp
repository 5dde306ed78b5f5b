#ifndef REBIND_RESET_ORCHESTRATOR_HPP
#define REBIND_RESET_ORCHESTRATOR_HPP
/**
 * @file Orchestrator.hpp
 * @brief End-to-end GPU reset: quiesce consumers, reload the driver, restore.
 *
 * Sequence:
 *  1. Decide whether the display manager must stop (forwarded DM, or a display
 *     server among the consumers plus a running display-manager unit).
 *  2. If it must, leave the login session first (SessionEscape). A failed
 *     launch aborts before anything is stopped.
 *  3. Under a scope guard that always runs restoration:
 *     stop GPU daemons, disable persistence, detect and reap consumers and
 *     watchers, stop the display manager, unload and reload the modules.
 *  4. Restore stopped services in reverse order, withholding the display
 *     manager if the driver did not end loaded.
 */

#include "src/gpu/inc/GpuManagement.hpp"
#include "src/gpu/inc/GpuTarget.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/reset/inc/ConsumerDetector.hpp"
#include "src/reset/inc/ProcessReaper.hpp"
#include "src/reset/inc/ReloadEngine.hpp"
#include "src/reset/inc/ResetConfig.hpp"
#include "src/reset/inc/ResetTypes.hpp"
#include "src/reset/inc/RestorationController.hpp"
#include "src/reset/inc/SessionEscape.hpp"
#include "src/system/inc/DetachedLauncher.hpp"
#include "src/system/inc/KernelModules.hpp"
#include "src/system/inc/ProcessTable.hpp"
#include "src/system/inc/ServiceManager.hpp"

#include <sys/types.h> // pid_t

#include <functional> // std::function
#include <optional>   // std::optional
#include <string>     // std::string
#include <vector>     // std::vector

namespace rebind {

namespace reset {

/// Device-node probe for the target (tests return fixed node lists).
using SurfaceProbe = std::function<gpu::DeviceSurface(const gpu::GpuTarget&)>;

/**
 * @brief Everything the orchestrator touches outside its own state.
 */
struct ResetDependencies {
  gpu::GpuManagement& gpu;
  system::ProcessTable& processes;
  system::ServiceManager& services;
  system::ModuleBinder& modules;
  system::DetachedLauncher& launcher;
  helpers::log::Logger& log;
  SurfaceProbe surface;       ///< Defaults to gpu::probeDeviceSurface with config paths
  InterruptCheck interrupted; ///< Defaults to "never"
  SleepFn sleep;              ///< Defaults to std::this_thread::sleep_for
};

/**
 * @brief Everything a run decided and did.
 */
struct RunReport {
  RunOutcome outcome{RunOutcome::Success};
  int exitCode{0};                           ///< Process exit status
  EscapeDecision escape{EscapeDecision::NotNeeded};
  bool relaunched{false};                    ///< Work happened in a detached copy
  std::optional<std::string> displayService; ///< Display manager planned for stop
  std::vector<ConsumerRecord> consumers;     ///< Last detection pass
  std::vector<pid_t> killed;                 ///< Consumers and watchers signalled
  std::vector<std::string> stoppedServices;  ///< Ledger contents, stop order
  bool reloadAttempted{false};
  ReloadResult reload;
  RestorationReport restoration;
  std::vector<Fault> faults; ///< All faults of the run, in order
};

class GpuResetOrchestrator {
public:
  GpuResetOrchestrator(ResetConfig config, ResetDependencies deps);

  /**
   * @brief Execute one run against a resolved target.
   * @param target GPU to reset.
   * @param relaunchCommand argv used if the run has to leave the session.
   */
  [[nodiscard]] RunReport run(const gpu::GpuTarget& target,
                              const std::vector<std::string>& relaunchCommand);

private:
  [[nodiscard]] std::optional<std::string> planDisplayService(const gpu::GpuTarget& target,
                                                              RunReport& report);
  void forwardPhase(const gpu::GpuTarget& target, ServiceStopLedger& ledger, RunReport& report);
  [[nodiscard]] bool halted(RunReport& report, const char* step);

  ResetConfig config_;
  ResetDependencies deps_;
  ConsumerClassifier classifier_;
};

} // namespace reset

} // namespace rebind

#endif // REBIND_RESET_ORCHESTRATOR_HPP
