/**
 * @file ResetConfig.cpp
 * @brief Configuration layering.
 */

#include "src/reset/inc/ResetConfig.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <ctime> // std::time

#include <fmt/core.h>

namespace rebind {

namespace reset {

namespace {

using rebind::helpers::args::firstValue;
using rebind::helpers::strings::parseInt;
using rebind::helpers::strings::split;

/// Non-empty environment value.
std::optional<std::string> nonEmpty(const system::EnvLookup& lookup, const char* name) {
  std::optional<std::string> value = lookup(name);
  if (!value || value->empty()) {
    return std::nullopt;
  }
  return value;
}

} // namespace

/* ----------------------------- ResetConfig ----------------------------- */

std::string ResetConfig::logFilePath() const {
  return fmt::format("{}/gpu-reset-{}.log", logDir, runId);
}

std::string ResetConfig::unitName() const { return fmt::format("gpu-reset-{}", runId); }

/* ----------------------------- Sources ----------------------------- */

void applyEnvironment(ResetConfig& config, const system::EnvLookup& lookup) {
  if (auto ts = nonEmpty(lookup, ENV_RUN_ID)) {
    config.runId = std::move(*ts);
  }
  if (auto dm = nonEmpty(lookup, ENV_DISPLAY_SERVICE)) {
    config.forwardedDisplayService = std::move(*dm);
  }
  if (auto target = nonEmpty(lookup, ENV_TARGET)) {
    config.target.pciBdf = std::move(*target);
  }
  if (auto user = nonEmpty(lookup, ENV_SUDO_USER)) {
    config.sudoUser = std::move(*user);
  }
}

void ensureRunId(ResetConfig& config) {
  if (config.runId.empty()) {
    config.runId = std::to_string(static_cast<long long>(std::time(nullptr)));
  }
}

helpers::args::ArgMap resetArgMap() {
  helpers::args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_DEVICE] = {"--device", 1, false, "GPU index among NVIDIA devices (default: 0)"};
  map[ARG_BDF] = {"--bdf", 1, false, "GPU PCI address, e.g. 0000:65:00.0 (overrides --device)"};
  map[ARG_SERVICES] = {"--services", 1, false,
                       "Comma-separated services to stop (default: nvidia-persistenced,"
                       "nvidia-fabricmanager,dcgm)"};
  map[ARG_MODULES] = {"--modules", 1, false,
                      "Comma-separated leaf-to-root unload order (default: nvidia_uvm,"
                      "nvidia_drm,nvidia_modeset,nvidia)"};
  map[ARG_LOG_DIR] = {"--log-dir", 1, false, "Log directory (default: /tmp)"};
  map[ARG_RETRY_DELAY] = {"--retry-delay-ms", 1, false, "Delay before an unload retry (default: 2000)"};
  map[ARG_VERBOSE] = {"--verbose", 0, false, "Log debug detail"};
  return map;
}

bool applyArgs(ResetConfig& config, const helpers::args::ParsedArgs& pargs, std::string& error) {
  if (const auto V = firstValue(pargs, ARG_DEVICE)) {
    const auto INDEX = parseInt(*V);
    if (!INDEX || *INDEX < 0) {
      error = fmt::format("Invalid --device '{}'", *V);
      return false;
    }
    config.target.deviceIndex = static_cast<int>(*INDEX);
  }
  if (const auto V = firstValue(pargs, ARG_BDF)) {
    if (!gpu::normalizeBdf(std::string(*V))) {
      error = fmt::format("Invalid --bdf '{}'", *V);
      return false;
    }
    config.target.pciBdf = std::string(*V);
  }
  if (const auto V = firstValue(pargs, ARG_SERVICES)) {
    config.managedServices = split(*V, ',');
  }
  if (const auto V = firstValue(pargs, ARG_MODULES)) {
    std::vector<std::string> units = split(*V, ',');
    if (units.empty()) {
      error = "--modules needs at least one module";
      return false;
    }
    config.unloadOrder = std::move(units);
  }
  if (const auto V = firstValue(pargs, ARG_LOG_DIR)) {
    config.logDir = std::string(*V);
  }
  if (const auto V = firstValue(pargs, ARG_RETRY_DELAY)) {
    const auto MS = parseInt(*V);
    if (!MS || *MS < 0) {
      error = fmt::format("Invalid --retry-delay-ms '{}'", *V);
      return false;
    }
    config.retryDelay = std::chrono::milliseconds(*MS);
  }
  if (pargs.count(ARG_VERBOSE) != 0) {
    config.verbose = true;
  }
  return true;
}

std::vector<std::pair<std::string, std::string>>
forwardedEnvironment(const ResetConfig& config, const std::string& displayService,
                     const std::string& targetBdf) {
  std::vector<std::pair<std::string, std::string>> env;
  if (config.sudoUser) {
    env.emplace_back(ENV_SUDO_USER, *config.sudoUser);
  }
  env.emplace_back(ENV_RUN_ID, config.runId);
  env.emplace_back(ENV_DISPLAY_SERVICE, displayService);
  env.emplace_back(ENV_TARGET, targetBdf);
  return env;
}

} // namespace reset

} // namespace rebind
