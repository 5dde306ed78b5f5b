#ifndef REBIND_SYSTEM_SERVICE_MANAGER_HPP
#define REBIND_SYSTEM_SERVICE_MANAGER_HPP
/**
 * @file ServiceManager.hpp
 * @brief Managed-service control (is-active, stop, start, list running).
 * @note Linux-only. The production implementation drives systemctl.
 */

#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

namespace rebind {

namespace system {

/* ----------------------------- ServiceManager ----------------------------- */

/**
 * @brief Service-management interface.
 *
 * Service ids are unit names as the service manager knows them
 * ("nvidia-persistenced", "gdm.service").
 */
class ServiceManager {
public:
  virtual ~ServiceManager() = default;

  /// True if the service is currently active.
  [[nodiscard]] virtual bool isActive(const std::string& id) = 0;

  /// Stop a service. Returns false on failure.
  [[nodiscard]] virtual bool stop(const std::string& id) = 0;

  /// Start a service. Returns false on failure.
  [[nodiscard]] virtual bool start(const std::string& id) = 0;

  /**
   * @brief Running services whose full unit name matches an ECMAScript regex.
   * @param pattern e.g. "(gdm3?|lightdm|sddm|xdm)\\.service".
   * @return Matching ids in service-manager order; empty on error.
   */
  [[nodiscard]] virtual std::vector<std::string> listRunning(const std::string& pattern) = 0;
};

/* ----------------------------- systemd ----------------------------- */

/**
 * @brief ServiceManager backed by systemctl.
 */
class SystemctlServiceManager final : public ServiceManager {
public:
  [[nodiscard]] bool isActive(const std::string& id) override;
  [[nodiscard]] bool stop(const std::string& id) override;
  [[nodiscard]] bool start(const std::string& id) override;
  [[nodiscard]] std::vector<std::string> listRunning(const std::string& pattern) override;
};

/**
 * @brief Extract unit names from `systemctl list-units --plain --no-legend` output.
 * @param output Command output; the unit name is the first column.
 * @return Unit names in order.
 */
[[nodiscard]] std::vector<std::string> parseUnitList(std::string_view output);

/**
 * @brief Filter unit names by a full-match ECMAScript regex.
 * @return Matching names; empty if the pattern is invalid.
 */
[[nodiscard]] std::vector<std::string> filterUnits(const std::vector<std::string>& units,
                                                   const std::string& pattern) noexcept;

} // namespace system

} // namespace rebind

#endif // REBIND_SYSTEM_SERVICE_MANAGER_HPP
