#ifndef REBIND_RESET_SERVICE_LEDGER_HPP
#define REBIND_RESET_SERVICE_LEDGER_HPP
/**
 * @file ServiceLedger.hpp
 * @brief Append-only record of the services a run stopped.
 *
 * Only services that were active and stopped successfully are recorded, in
 * stop order. Restoration walks the ledger in reverse and never looks at
 * anything else.
 */

#include "src/helpers/inc/Log.hpp"
#include "src/system/inc/ServiceManager.hpp"

#include <cstddef> // std::size_t
#include <cstdint> // std::uint8_t
#include <string>  // std::string
#include <vector>  // std::vector

namespace rebind {

namespace reset {

/* ----------------------------- StopResult ----------------------------- */

/**
 * @brief Observable result of stopIfRunning().
 */
enum class StopResult : std::uint8_t {
  Stopped = 0, ///< Was active, stopped, recorded
  Skipped = 1, ///< Not active, or already recorded by this run
  Failed = 2,  ///< Was active but the stop failed; not recorded
};

[[nodiscard]] const char* toString(StopResult result) noexcept;

/* ----------------------------- ServiceStopLedger ----------------------------- */

class ServiceStopLedger {
public:
  ServiceStopLedger(system::ServiceManager& services, helpers::log::Logger& log) noexcept
      : services_(services), log_(log) {}

  /**
   * @brief Stop a service if it is active and record it.
   *
   * Idempotent: a second call for the same id is a Skipped no-op.
   */
  [[nodiscard]] StopResult stopIfRunning(const std::string& id);

  /// Stopped services in stop order.
  [[nodiscard]] const std::vector<std::string>& entries() const noexcept { return entries_; }

  [[nodiscard]] bool contains(const std::string& id) const noexcept;
  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

private:
  system::ServiceManager& services_;
  helpers::log::Logger& log_;
  std::vector<std::string> entries_;
};

} // namespace reset

} // namespace rebind

#endif // REBIND_RESET_SERVICE_LEDGER_HPP
