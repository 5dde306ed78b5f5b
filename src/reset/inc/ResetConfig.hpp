#ifndef REBIND_RESET_RESET_CONFIG_HPP
#define REBIND_RESET_RESET_CONFIG_HPP
/**
 * @file ResetConfig.hpp
 * @brief Configuration of a reset run: defaults, environment, CLI flags.
 *
 * Later sources win: built-in defaults, then the environment (TS, DM,
 * GPU_RESET_TARGET, which is also how a relaunched run receives its
 * parent's decisions), then command-line flags.
 */

#include "src/gpu/inc/GpuTarget.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/reset/inc/ConsumerDetector.hpp"
#include "src/reset/inc/ProcessReaper.hpp"
#include "src/reset/inc/ReloadEngine.hpp"
#include "src/system/inc/DetachedLauncher.hpp"

#include <chrono>   // std::chrono::milliseconds
#include <cstdint>  // std::uint8_t
#include <optional> // std::optional
#include <string>   // std::string
#include <utility>  // std::pair
#include <vector>   // std::vector

namespace rebind {

namespace reset {

/* ----------------------------- Constants ----------------------------- */

/// Run id (timestamp) forwarded to a relaunched run.
inline constexpr const char* ENV_RUN_ID = "TS";

/// Display service chosen by the parent run.
inline constexpr const char* ENV_DISPLAY_SERVICE = "DM";

/// Target BDF chosen by the parent run.
inline constexpr const char* ENV_TARGET = "GPU_RESET_TARGET";

/// Invoking user, forwarded for the log.
inline constexpr const char* ENV_SUDO_USER = "SUDO_USER";

/// Running display managers.
inline constexpr const char* DEFAULT_DISPLAY_SERVICE_PATTERN = R"((gdm3?|lightdm|sddm|xdm)\.service)";

/// GPU daemons stopped before unloading, in stop order.
inline const std::vector<std::string> DEFAULT_MANAGED_SERVICES = {
    "nvidia-persistenced", "nvidia-fabricmanager", "dcgm"};

/* ----------------------------- ResetConfig ----------------------------- */

struct ResetConfig {
  gpu::TargetSelector target;                                       ///< Which GPU
  std::vector<std::string> managedServices{DEFAULT_MANAGED_SERVICES}; ///< Stop order
  std::vector<std::string> unloadOrder{DEFAULT_UNLOAD_ORDER};       ///< Leaf-to-root
  std::string displayProcessPattern{DEFAULT_DISPLAY_PROCESS_PATTERN};
  std::string displayServicePattern{DEFAULT_DISPLAY_SERVICE_PATTERN};
  std::vector<std::string> watcherPatterns{DEFAULT_WATCHER_PATTERN};
  std::chrono::milliseconds retryDelay{DEFAULT_RETRY_DELAY};
  std::chrono::milliseconds displaySettleDelay{2000}; ///< After stopping the display manager
  std::chrono::milliseconds preUnloadDelay{1000};     ///< Before the first unload
  std::string logDir{"/tmp"};
  std::string runId;                                  ///< Empty until ensureRunId()
  std::optional<std::string> forwardedDisplayService; ///< From DM
  std::optional<std::string> sudoUser;                ///< From SUDO_USER
  gpu::SysPaths paths;
  bool verbose{false};

  /// "<logDir>/gpu-reset-<runId>.log"
  [[nodiscard]] std::string logFilePath() const;

  /// "gpu-reset-<runId>"
  [[nodiscard]] std::string unitName() const;
};

/* ----------------------------- Sources ----------------------------- */

/**
 * @brief Overlay TS, DM, GPU_RESET_TARGET and SUDO_USER. Empty values are ignored.
 */
void applyEnvironment(ResetConfig& config, const system::EnvLookup& lookup);

/// Set runId to the current epoch seconds if still empty.
void ensureRunId(ResetConfig& config);

/// Flag keys for resetArgMap().
enum ResetArg : std::uint8_t {
  ARG_HELP = 0,
  ARG_DEVICE = 1,
  ARG_BDF = 2,
  ARG_SERVICES = 3,
  ARG_MODULES = 4,
  ARG_LOG_DIR = 5,
  ARG_RETRY_DELAY = 6,
  ARG_VERBOSE = 7,
};

/// Flags accepted by gpu-reset.
[[nodiscard]] helpers::args::ArgMap resetArgMap();

/**
 * @brief Overlay parsed flags.
 * @return false with error set if a value is malformed.
 */
[[nodiscard]] bool applyArgs(ResetConfig& config, const helpers::args::ParsedArgs& pargs,
                             std::string& error);

/**
 * @brief Environment to forward into a relaunched run.
 * @param displayService Display manager the parent decided to stop.
 * @param targetBdf Target the parent resolved.
 */
[[nodiscard]] std::vector<std::pair<std::string, std::string>>
forwardedEnvironment(const ResetConfig& config, const std::string& displayService,
                     const std::string& targetBdf);

} // namespace reset

} // namespace rebind

#endif // REBIND_RESET_RESET_CONFIG_HPP
