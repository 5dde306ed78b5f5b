#ifndef REBIND_RESET_SESSION_ESCAPE_HPP
#define REBIND_RESET_SESSION_ESCAPE_HPP
/**
 * @file SessionEscape.hpp
 * @brief Move the run out of the login session before stopping the display manager.
 *
 * Stopping the display manager tears down the graphical session and every
 * process in it, the running reset included. When such a stop is planned the
 * run is relaunched as a transient system unit and the original invocation
 * only waits for it.
 */

#include "src/helpers/inc/Log.hpp"
#include "src/system/inc/DetachedLauncher.hpp"

#include <cstdint> // std::uint8_t
#include <string>  // std::string

namespace rebind {

namespace reset {

enum class EscapeDecision : std::uint8_t {
  NotNeeded = 0,       ///< No session-owning service will be stopped
  AlreadyDetached = 1, ///< Running under the service manager already
  Relaunched = 2,      ///< Detached copy ran; this invocation must exit with its status
  LaunchFailed = 3,    ///< Could not detach; the run must abort before any stop
};

[[nodiscard]] const char* toString(EscapeDecision decision) noexcept;

struct EscapeResult {
  EscapeDecision decision{EscapeDecision::NotNeeded};
  int exitCode{0};    ///< Detached run's status when Relaunched
  std::string detail; ///< Launcher diagnostics when LaunchFailed
};

class SessionEscape {
public:
  SessionEscape(system::DetachedLauncher& launcher, helpers::log::Logger& log) noexcept
      : launcher_(launcher), log_(log) {}

  /**
   * @brief Decide and, if needed, relaunch.
   * @param stopsSessionService True if the plan stops the display manager.
   * @param request What to relaunch.
   */
  [[nodiscard]] EscapeResult ensureDetached(bool stopsSessionService,
                                            const system::LaunchRequest& request);

private:
  system::DetachedLauncher& launcher_;
  helpers::log::Logger& log_;
};

} // namespace reset

} // namespace rebind

#endif // REBIND_RESET_SESSION_ESCAPE_HPP
