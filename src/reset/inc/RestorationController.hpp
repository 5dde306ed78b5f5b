#ifndef REBIND_RESET_RESTORATION_CONTROLLER_HPP
#define REBIND_RESET_RESTORATION_CONTROLLER_HPP
/**
 * @file RestorationController.hpp
 * @brief Restart the services a run stopped.
 *
 * Works only from the ledger and the policy; it never re-probes the system.
 * If the kernel binding is not intact the display service is withheld so the
 * machine does not fall into a login loop, and the operator gets the exact
 * manual recovery command.
 */

#include "src/helpers/inc/Log.hpp"
#include "src/reset/inc/ResetTypes.hpp"
#include "src/reset/inc/ServiceLedger.hpp"
#include "src/system/inc/ServiceManager.hpp"

#include <optional> // std::optional
#include <string>   // std::string
#include <vector>   // std::vector

namespace rebind {

namespace reset {

/**
 * @brief Inputs that decide what gets restarted.
 */
struct RestorationPolicy {
  std::optional<std::string> displayService; ///< Session-owning service stopped by this run
  bool bindingIntact{true};                  ///< False if the driver did not end loaded
  std::string rootUnit{"nvidia"};            ///< Module named in the recovery command
};

/**
 * @brief What restoration did.
 */
struct RestorationReport {
  std::vector<std::string> restarted; ///< Started successfully, in restore order
  std::vector<std::string> failed;    ///< Start failed
  std::vector<std::string> withheld;  ///< Deliberately not started
  std::vector<Fault> faults;          ///< RestoreFailure entries
};

/**
 * @brief Manual recovery command for a withheld display service.
 */
[[nodiscard]] std::string recoveryCommand(const std::string& rootUnit,
                                          const std::string& displayService);

class RestorationController {
public:
  RestorationController(system::ServiceManager& services, helpers::log::Logger& log) noexcept
      : services_(services), log_(log) {}

  /**
   * @brief Restart every ledger entry in reverse stop order.
   *
   * A failed start is logged and recorded; the remaining entries are still
   * attempted.
   */
  [[nodiscard]] RestorationReport restoreAll(const ServiceStopLedger& ledger,
                                             const RestorationPolicy& policy);

private:
  system::ServiceManager& services_;
  helpers::log::Logger& log_;
};

} // namespace reset

} // namespace rebind

#endif // REBIND_RESET_RESTORATION_CONTROLLER_HPP
