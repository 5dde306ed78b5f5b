#ifndef REBIND_RESET_RELOAD_ENGINE_HPP
#define REBIND_RESET_RELOAD_ENGINE_HPP
/**
 * @file ReloadEngine.hpp
 * @brief Release and reacquire the driver's kernel modules.
 *
 * State machine:
 *
 *   Bound -> Unloading -> Unloaded -> Reloading -> Bound
 *              |                          |
 *              +--(rollback)--> Bound     +--> Failed
 *              +--(rollback fails)--> Failed
 *
 * Units are released leaf-to-root. Every successful release is appended to the
 * unload set before the next unit is touched, so a partial failure rolls back
 * exactly what was released, in reverse. A planned unit that was loaded when
 * the run began but disappeared with an earlier unit's dependencies is also
 * recorded as released.
 */

#include "src/helpers/inc/Log.hpp"
#include "src/reset/inc/ResetTypes.hpp"
#include "src/system/inc/KernelModules.hpp"

#include <chrono>     // std::chrono::milliseconds
#include <cstddef>    // std::size_t
#include <cstdint>    // std::uint8_t
#include <functional> // std::function
#include <string>     // std::string
#include <vector>     // std::vector

namespace rebind {

namespace reset {

/* ----------------------------- Types ----------------------------- */

enum class BindingState : std::uint8_t {
  Bound = 0,
  Unloading = 1,
  Unloaded = 2,
  Reloading = 3,
  Failed = 4,
};

[[nodiscard]] const char* toString(BindingState state) noexcept;

/// Default leaf-to-root unload order of the NVIDIA stack.
inline const std::vector<std::string> DEFAULT_UNLOAD_ORDER = {"nvidia_uvm", "nvidia_drm",
                                                              "nvidia_modeset", "nvidia"};

/// Pause between a failed release and its single retry.
inline constexpr std::chrono::milliseconds DEFAULT_RETRY_DELAY{2000};

/// Sleep hook (tests pass a recorder).
using SleepFn = std::function<void(std::chrono::milliseconds)>;

/// Interruption check between units.
using InterruptCheck = std::function<bool()>;

/**
 * @brief Ordered set of units released in this run. Append-only.
 */
class ModuleUnloadSet {
public:
  void append(const std::string& unit) { units_.push_back(unit); }
  [[nodiscard]] const std::vector<std::string>& units() const noexcept { return units_; }
  [[nodiscard]] bool empty() const noexcept { return units_.empty(); }
  [[nodiscard]] std::size_t size() const noexcept { return units_.size(); }

private:
  std::vector<std::string> units_;
};

struct ReloadOptions {
  std::vector<std::string> unloadOrder{DEFAULT_UNLOAD_ORDER}; ///< Leaf-to-root
  std::chrono::milliseconds retryDelay{DEFAULT_RETRY_DELAY};
};

/**
 * @brief Result of one engine run.
 */
struct ReloadResult {
  RunOutcome outcome{RunOutcome::Success};
  bool bindingIntact{true};           ///< False unless the driver ended loaded
  ModuleUnloadSet released;           ///< Units released, in release order
  std::vector<std::string> reloaded;  ///< Units reacquired (reload or rollback), in order
  std::vector<BindingState> states;   ///< Every state entered, starting with Bound
  std::vector<Fault> faults;          ///< ReleaseFailure / ReacquireFailure entries
  std::string failedUnit;             ///< Unit that ended the forward phase, if any
};

/* ----------------------------- ReloadEngine ----------------------------- */

class ReloadEngine {
public:
  ReloadEngine(system::ModuleBinder& binder, helpers::log::Logger& log, ReloadOptions options,
               SleepFn sleep, InterruptCheck interrupted);

  /**
   * @brief Unload, then reload.
   *
   * Interruption is honored between unload units only; once reload starts it
   * runs to completion.
   */
  [[nodiscard]] ReloadResult run();

  [[nodiscard]] BindingState state() const noexcept { return state_; }

private:
  void enter(BindingState next, ReloadResult& result);
  [[nodiscard]] bool releaseWithRetry(const std::string& unit, ReloadResult& result);
  void rollback(ReloadResult& result);
  void reload(ReloadResult& result);

  system::ModuleBinder& binder_;
  helpers::log::Logger& log_;
  ReloadOptions options_;
  SleepFn sleep_;
  InterruptCheck interrupted_;
  BindingState state_{BindingState::Bound};
};

} // namespace reset

} // namespace rebind

#endif // REBIND_RESET_RELOAD_ENGINE_HPP
