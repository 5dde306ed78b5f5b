/**
 * @file Orchestrator.cpp
 * @brief Reset run sequencing.
 */

#include "src/reset/inc/Orchestrator.hpp"
#include "src/helpers/inc/ScopeGuard.hpp"
#include "src/reset/inc/Interrupt.hpp"

#include <exception> // std::exception
#include <thread>    // std::this_thread::sleep_for
#include <utility>   // std::move

namespace rebind {

namespace reset {

namespace {

template <typename T> void appendAll(std::vector<T>& dst, const std::vector<T>& src) {
  dst.insert(dst.end(), src.begin(), src.end());
}

} // namespace

GpuResetOrchestrator::GpuResetOrchestrator(ResetConfig config, ResetDependencies deps)
    : config_(std::move(config)), deps_(std::move(deps)),
      classifier_(config_.displayProcessPattern) {
  if (!deps_.surface) {
    deps_.surface = [paths = config_.paths](const gpu::GpuTarget& target) {
      return gpu::probeDeviceSurface(target, paths);
    };
  }
  if (!deps_.interrupted) {
    deps_.interrupted = [] { return false; };
  }
  if (!deps_.sleep) {
    deps_.sleep = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
  if (!classifier_.valid()) {
    deps_.log.warn("Invalid display process pattern '{}', no process will be treated as a "
                   "display server",
                   config_.displayProcessPattern);
  }
}

bool GpuResetOrchestrator::halted(RunReport& report, const char* step) {
  if (!deps_.interrupted()) {
    return false;
  }
  const int SIGNO = InterruptScope::signalNumber();
  if (SIGNO != 0) {
    deps_.log.warn("Interrupted by signal {} {}, aborting", SIGNO, step);
  } else {
    deps_.log.warn("Interrupted {}, aborting", step);
  }
  report.outcome = RunOutcome::Aborted;
  return true;
}

std::optional<std::string> GpuResetOrchestrator::planDisplayService(const gpu::GpuTarget& target,
                                                                    RunReport& report) {
  helpers::log::Logger& log = deps_.log;
  if (config_.forwardedDisplayService) {
    log.info("Display manager to stop (forwarded): {}", *config_.forwardedDisplayService);
    return config_.forwardedDisplayService;
  }

  ConsumerDetector detector(deps_.gpu, deps_.processes, classifier_, log);
  const DetectionResult DET = detector.detect(target, deps_.surface(target));
  report.consumers = DET.consumers;
  appendAll(report.faults, DET.faults);

  if (!DET.hasDisplayServer()) {
    log.info("No display server on the GPU, display manager stays up");
    return std::nullopt;
  }

  const std::vector<std::string> RUNNING = deps_.services.listRunning(config_.displayServicePattern);
  if (RUNNING.empty()) {
    log.warn("Display server holds the GPU but no running unit matches {}; unload may fail",
             config_.displayServicePattern);
    return std::nullopt;
  }
  log.info("Display server detected, will stop {}", RUNNING.front());
  return RUNNING.front();
}

void GpuResetOrchestrator::forwardPhase(const gpu::GpuTarget& target, ServiceStopLedger& ledger,
                                        RunReport& report) {
  helpers::log::Logger& log = deps_.log;

  // GPU daemons
  for (const std::string& id : config_.managedServices) {
    if (halted(report, "while stopping services")) {
      return;
    }
    if (ledger.stopIfRunning(id) == StopResult::Failed) {
      report.faults.push_back({FaultKind::StopFailure, id, "stop failed"});
    }
  }
  if (halted(report, "after stopping services")) {
    return;
  }

  if (deps_.gpu.disablePersistence(target)) {
    log.info("Persistence mode disabled");
  } else {
    log.warn("Could not disable persistence mode on {}", target.pciBdf);
  }

  // Consumers: detect again now that the daemons are gone.
  ConsumerDetector detector(deps_.gpu, deps_.processes, classifier_, log);
  const DetectionResult DET = detector.detect(target, deps_.surface(target));
  report.consumers = DET.consumers;
  appendAll(report.faults, DET.faults);

  ProcessReaper reaper(deps_.processes, classifier_, log);
  appendAll(report.killed, reaper.reap(DET.consumers).killed);
  appendAll(report.killed, reaper.reapWatchers(config_.watcherPatterns).killed);

  // Display manager
  if (report.displayService) {
    if (halted(report, "before stopping the display manager")) {
      return;
    }
    const StopResult RES = ledger.stopIfRunning(*report.displayService);
    if (RES == StopResult::Stopped) {
      log.info("Waiting {} ms for the display stack to release the GPU",
               config_.displaySettleDelay.count());
      deps_.sleep(config_.displaySettleDelay);
    } else if (RES == StopResult::Failed) {
      report.faults.push_back({FaultKind::StopFailure, *report.displayService, "stop failed"});
    }
  }

  if (halted(report, "before unloading modules")) {
    return;
  }
  deps_.sleep(config_.preUnloadDelay);

  // Kernel modules
  ReloadOptions options;
  options.unloadOrder = config_.unloadOrder;
  options.retryDelay = config_.retryDelay;
  ReloadEngine engine(deps_.modules, log, std::move(options), deps_.sleep, deps_.interrupted);
  report.reloadAttempted = true;
  // Unknown until the engine returns; an exception leaves the display manager withheld.
  report.reload.bindingIntact = false;
  report.reload = engine.run();
  report.outcome = report.reload.outcome;
  appendAll(report.faults, report.reload.faults);

  if (report.outcome != RunOutcome::Success) {
    return;
  }
  log.info("GPU reset complete");
  if (const auto STATUS = deps_.gpu.liveStatus(target)) {
    log.info("GPU status: {}", STATUS->toString());
  } else {
    log.debug("Live status unavailable");
  }
}

RunReport GpuResetOrchestrator::run(const gpu::GpuTarget& target,
                                    const std::vector<std::string>& relaunchCommand) {
  helpers::log::Logger& log = deps_.log;
  RunReport report;
  log.info("GPU reset run {} on {}", config_.runId, target.toString());
  if (config_.sudoUser) {
    log.debug("Invoked by {}", *config_.sudoUser);
  }

  report.displayService = planDisplayService(target, report);
  if (halted(report, "before any change")) {
    report.exitCode = toExitCode(report.outcome);
    return report;
  }

  // Leave the login session before anything can tear it down.
  system::LaunchRequest request;
  request.unitName = config_.unitName();
  request.command = relaunchCommand;
  request.env = forwardedEnvironment(config_, report.displayService.value_or(std::string{}),
                                     target.pciBdf);
  SessionEscape escape(deps_.launcher, log);
  const EscapeResult ESC = escape.ensureDetached(report.displayService.has_value(), request);
  report.escape = ESC.decision;

  if (ESC.decision == EscapeDecision::LaunchFailed) {
    log.error("Cannot leave the login session, aborting before any service is stopped");
    report.outcome = RunOutcome::Aborted;
    report.exitCode = toExitCode(report.outcome);
    return report;
  }
  if (ESC.decision == EscapeDecision::Relaunched) {
    report.relaunched = true;
    report.exitCode = ESC.exitCode;
    report.outcome = (ESC.exitCode >= 0 && ESC.exitCode <= toExitCode(RunOutcome::Aborted))
                         ? static_cast<RunOutcome>(ESC.exitCode)
                         : RunOutcome::Aborted;
    return report;
  }

  ServiceStopLedger ledger(deps_.services, log);
  RestorationController restorer(deps_.services, log);
  {
    auto restore = helpers::makeScopeGuard([&]() noexcept {
      try {
        RestorationPolicy policy;
        policy.displayService = report.displayService;
        policy.bindingIntact = report.reload.bindingIntact;
        policy.rootUnit = config_.unloadOrder.empty() ? std::string(gpu::NVIDIA_DRIVER)
                                                      : config_.unloadOrder.back();
        report.restoration = restorer.restoreAll(ledger, policy);
      } catch (const std::exception& e) {
        log.error("Service restoration failed: {}", e.what());
      }
    });
    forwardPhase(target, ledger, report);
  }

  report.stoppedServices = ledger.entries();
  appendAll(report.faults, report.restoration.faults);
  report.exitCode = toExitCode(report.outcome);

  for (const Fault& fault : report.faults) {
    log.debug("fault: {}", fault.toString());
  }
  log.info("GPU reset finished: {} (exit {})", toString(report.outcome), report.exitCode);
  return report;
}

} // namespace reset

} // namespace rebind
