/**
 * @file gpu-reset.cpp
 * @brief Reload the NVIDIA kernel modules without rebooting.
 *
 * Stops GPU daemons, kills compute processes, stops the display manager when a
 * display server holds the GPU (relaunching itself under systemd first),
 * unloads and reloads the driver stack, then restarts what it stopped.
 */

#include "src/gpu/inc/GpuManagement.hpp"
#include "src/gpu/inc/GpuTarget.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/reset/inc/Interrupt.hpp"
#include "src/reset/inc/Orchestrator.hpp"
#include "src/reset/inc/ResetConfig.hpp"
#include "src/system/inc/Command.hpp"
#include "src/system/inc/DetachedLauncher.hpp"
#include "src/system/inc/KernelModules.hpp"
#include "src/system/inc/ProcessTable.hpp"
#include "src/system/inc/ServiceManager.hpp"

#include <unistd.h> // geteuid

#include <cstring>     // std::strerror
#include <exception>   // std::exception
#include <memory>      // std::make_shared
#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

#include <fmt/core.h>

namespace reset = rebind::reset;
namespace sys = rebind::system;

using rebind::helpers::log::ConsoleSink;
using rebind::helpers::log::FileSink;
using rebind::helpers::log::Level;
using rebind::helpers::log::Logger;

namespace {

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Reset an NVIDIA GPU by reloading its kernel modules, stopping and restoring\n"
    "everything that holds the device.";

/// Exit status when the target GPU cannot be found.
constexpr int EXIT_NO_TARGET = reset::toExitCode(reset::RunOutcome::Aborted);

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const rebind::helpers::args::ArgMap ARG_MAP = reset::resetArgMap();
  rebind::helpers::args::ParsedArgs pargs;

  std::vector<std::string_view> args;
  std::vector<std::string> rawArgs;
  args.reserve(static_cast<std::size_t>(argc > 0 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
    rawArgs.emplace_back(argv[i]);
  }

  std::string error;
  if (!rebind::helpers::args::parseArgs(args, ARG_MAP, pargs, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    rebind::helpers::args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 1;
  }
  if (pargs.count(reset::ARG_HELP) != 0) {
    rebind::helpers::args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 0;
  }

  reset::ResetConfig config;
  reset::applyEnvironment(config, sys::processEnv);
  if (!reset::applyArgs(config, pargs, error)) {
    fmt::print(stderr, "Error: {}\n", error);
    return 1;
  }
  reset::ensureRunId(config);

  std::string self = sys::selfExecutablePath();
  if (self.empty()) {
    self = argv[0];
  }

  // Root is required for modprobe, systemctl and kill.
  if (::geteuid() != 0) {
    std::vector<std::string> sudoArgv{"sudo", self};
    sudoArgv.insert(sudoArgv.end(), rawArgs.begin(), rawArgs.end());
    const int ERR = sys::execReplace(sudoArgv);
    fmt::print(stderr, "Error: cannot re-run as root via sudo: {}\n", std::strerror(ERR));
    return 1;
  }

  Logger logger;
  logger.setLevel(config.verbose ? Level::Debug : Level::Info);
  logger.addSink(std::make_shared<ConsoleSink>());
  auto file = std::make_shared<FileSink>(config.logFilePath());
  if (file->valid()) {
    fmt::print("Logging to {}\n", file->path());
    logger.addSink(file);
  } else {
    fmt::print(stderr, "Warning: cannot open {}, logging to console only\n", file->path());
  }

  const auto TARGET = rebind::gpu::resolveTarget(config.target, config.paths);
  if (!TARGET) {
    logger.error("No NVIDIA GPU matches {}",
                 config.target.pciBdf ? *config.target.pciBdf
                                      : fmt::format("index {}", config.target.deviceIndex.value_or(0)));
    return EXIT_NO_TARGET;
  }

  const std::unique_ptr<rebind::gpu::GpuManagement> GPU = rebind::gpu::makeGpuManagement();
  sys::ProcfsProcessTable processes(config.paths.proc);
  sys::SystemctlServiceManager services;
  sys::ModprobeBinder modules(config.paths.proc + "/modules");
  sys::SystemdRunLauncher launcher;
  logger.debug("GPU management backend: {}", GPU->name());

  reset::InterruptScope interrupts;
  reset::ResetDependencies deps{*GPU,     processes, services, modules,
                                launcher, logger,    {},       &reset::InterruptScope::interrupted,
                                {}};

  std::vector<std::string> relaunch{self};
  relaunch.insert(relaunch.end(), rawArgs.begin(), rawArgs.end());

  try {
    reset::GpuResetOrchestrator orchestrator(config, deps);
    const reset::RunReport REPORT = orchestrator.run(*TARGET, relaunch);
    return REPORT.exitCode;
  } catch (const std::exception& e) {
    logger.error("Reset failed: {}", e.what());
    return reset::toExitCode(reset::RunOutcome::Aborted);
  }
}
