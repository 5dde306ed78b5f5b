#ifndef REBIND_SYSTEM_KERNEL_MODULES_HPP
#define REBIND_SYSTEM_KERNEL_MODULES_HPP
/**
 * @file KernelModules.hpp
 * @brief Loaded kernel module inventory and module bind/unbind control.
 * @note Linux-only. Reads /proc/modules; loads and unloads through modprobe.
 *
 * A "binding unit" in rebind is one kernel module of the GPU driver stack
 * (nvidia, nvidia_modeset, nvidia_drm, nvidia_uvm). Releasing it is
 * `modprobe -r`, reacquiring it is `modprobe`.
 */

#include <cstddef> // std::size_t
#include <cstdint> // std::int32_t
#include <string>  // std::string
#include <string_view>
#include <utility> // std::move
#include <vector>  // std::vector

namespace rebind {

namespace system {

/* ----------------------------- Constants ----------------------------- */

/// Default location of the module list.
inline constexpr const char* PROC_MODULES_PATH = "/proc/modules";

/* ----------------------------- LoadedModule ----------------------------- */

/**
 * @brief One line of /proc/modules.
 */
struct LoadedModule {
  std::string name;                 ///< Module name (underscored, e.g. "nvidia_drm")
  std::size_t sizeBytes{0};         ///< Module size
  std::int32_t useCount{0};         ///< Reference count
  std::vector<std::string> holders; ///< Modules that depend on this one
  std::string state;                ///< "Live", "Loading", "Unloading"

  /// @brief Human-readable single-line summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Inventory API ----------------------------- */

/**
 * @brief Parse /proc/modules text.
 * @param text File contents.
 * @return Modules in file order; malformed lines are skipped.
 *
 * Line format: name size use_count holders state offset [taint]
 * Example: nvidia 56442880 1639 nvidia_modeset,nvidia_uvm, Live 0x0000000000000000 (POE)
 */
[[nodiscard]] std::vector<LoadedModule> parseProcModules(std::string_view text);

/**
 * @brief Read the current module list.
 * @param path Alternate path (tests); defaults to /proc/modules.
 * @return Modules; empty if the file is unreadable.
 */
[[nodiscard]] std::vector<LoadedModule>
getLoadedModules(const std::string& path = PROC_MODULES_PATH) noexcept;

/**
 * @brief Normalize a module name the way the kernel reports it ('-' -> '_').
 */
[[nodiscard]] std::string normalizeModuleName(std::string_view name);

/* ----------------------------- ModuleBinder ----------------------------- */

/**
 * @brief Kernel-binding management interface.
 *
 * Implementations must be synchronous: when unbind() returns true the unit is no
 * longer loaded.
 */
class ModuleBinder {
public:
  virtual ~ModuleBinder() = default;

  /// Release a binding unit. Returns false on failure.
  [[nodiscard]] virtual bool unbind(const std::string& unit) = 0;

  /// Reacquire a binding unit. Returns false on failure.
  [[nodiscard]] virtual bool bind(const std::string& unit) = 0;

  /// True if the unit is currently loaded.
  [[nodiscard]] virtual bool isBound(const std::string& unit) = 0;

  /// Diagnostic text from the last failed call (may be empty).
  [[nodiscard]] virtual std::string lastError() const { return {}; }
};

/**
 * @brief ModuleBinder backed by modprobe and /proc/modules.
 */
class ModprobeBinder final : public ModuleBinder {
public:
  explicit ModprobeBinder(std::string procModulesPath = PROC_MODULES_PATH)
      : procModulesPath_(std::move(procModulesPath)) {}

  [[nodiscard]] bool unbind(const std::string& unit) override;
  [[nodiscard]] bool bind(const std::string& unit) override;
  [[nodiscard]] bool isBound(const std::string& unit) override;
  [[nodiscard]] std::string lastError() const override { return lastError_; }

private:
  std::string procModulesPath_;
  std::string lastError_;
};

} // namespace system

} // namespace rebind

#endif // REBIND_SYSTEM_KERNEL_MODULES_HPP
