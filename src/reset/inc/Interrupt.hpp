#ifndef REBIND_RESET_INTERRUPT_HPP
#define REBIND_RESET_INTERRUPT_HPP
/**
 * @file Interrupt.hpp
 * @brief Turn SIGINT/SIGTERM/SIGHUP into a flag polled between reset steps.
 *
 * The handlers only store the signal number. The run notices it at the next
 * step boundary and unwinds through its normal restoration path.
 */

#include <signal.h> // struct sigaction

#include <array> // std::array

namespace rebind {

namespace reset {

/**
 * @brief Installs the handlers for its lifetime. At most one instance at a time.
 */
class InterruptScope {
public:
  InterruptScope() noexcept;
  ~InterruptScope();

  InterruptScope(const InterruptScope&) = delete;
  InterruptScope& operator=(const InterruptScope&) = delete;

  /// True once any handled signal arrived.
  [[nodiscard]] static bool interrupted() noexcept;

  /// Number of the first signal received, 0 if none.
  [[nodiscard]] static int signalNumber() noexcept;

  /// Clear the flag (tests).
  static void reset() noexcept;

  /// Set the flag as if a signal arrived (tests).
  static void raiseFlag(int signo) noexcept;

private:
  static constexpr std::array<int, 3> SIGNALS{SIGINT, SIGTERM, SIGHUP};
  std::array<struct sigaction, 3> previous_{};
  std::array<bool, 3> installed_{};
};

} // namespace reset

} // namespace rebind

#endif // REBIND_RESET_INTERRUPT_HPP
