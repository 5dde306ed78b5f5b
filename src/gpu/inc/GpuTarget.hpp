#ifndef REBIND_GPU_GPU_TARGET_HPP
#define REBIND_GPU_GPU_TARGET_HPP
/**
 * @file GpuTarget.hpp
 * @brief Target GPU resolution and its device-node surface.
 * @note Linux-only. Reads /sys/bus/pci/devices, /sys/class/drm and
 *       /proc/driver/nvidia/gpus. All roots are overridable for tests.
 */

#include <optional> // std::optional
#include <string>   // std::string
#include <vector>   // std::vector

namespace rebind {

namespace gpu {

/* ----------------------------- Constants ----------------------------- */

/// PCI vendor id of NVIDIA devices as sysfs prints it.
inline constexpr const char* NVIDIA_PCI_VENDOR = "0x10de";

/// Kernel driver name owning NVIDIA GPUs.
inline constexpr const char* NVIDIA_DRIVER = "nvidia";

/* ----------------------------- SysPaths ----------------------------- */

/**
 * @brief Filesystem roots used for discovery.
 */
struct SysPaths {
  std::string sys{"/sys"};   ///< sysfs root
  std::string proc{"/proc"}; ///< procfs root
  std::string dev{"/dev"};   ///< device-node root
};

/* ----------------------------- GpuTarget ----------------------------- */

/**
 * @brief The one GPU a run operates on. Immutable for the run.
 */
struct GpuTarget {
  int deviceIndex{-1};            ///< Ordinal among NVIDIA PCI display devices (BDF order)
  std::string pciBdf;             ///< "0000:65:00.0"
  std::optional<int> deviceMinor; ///< N of /dev/nvidiaN; nullopt if the driver is not loaded

  /// @brief Human-readable single-line summary.
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief How the caller selects the target.
 *
 * A BDF wins over an index. With neither, index 0 is used.
 */
struct TargetSelector {
  std::optional<int> deviceIndex;   ///< --device N
  std::optional<std::string> pciBdf; ///< --bdf / GPU_RESET_TARGET
};

/**
 * @brief Device nodes through which processes reach the target.
 */
struct DeviceSurface {
  std::vector<std::string> drmCards;     ///< /dev/dri/cardN owned by the driver
  std::vector<std::string> computeNodes; ///< /dev/nvidiaN, nvidiactl, nvidia-uvm*
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Canonical BDF: lowercase with a 4-digit domain ("65:00.0" -> "0000:65:00.0").
 * @return nullopt if the text is not a BDF.
 */
[[nodiscard]] std::optional<std::string> normalizeBdf(const std::string& text);

/**
 * @brief NVIDIA display-class PCI devices, sorted by BDF.
 */
[[nodiscard]] std::vector<std::string> listNvidiaGpus(const SysPaths& paths = {}) noexcept;

/**
 * @brief Read "Device Minor:" from the driver's per-GPU information file.
 */
[[nodiscard]] std::optional<int> readDeviceMinor(const std::string& bdf,
                                                 const SysPaths& paths = {}) noexcept;

/**
 * @brief Resolve the target GPU.
 * @return nullopt if the selected device does not exist.
 */
[[nodiscard]] std::optional<GpuTarget> resolveTarget(const TargetSelector& selector,
                                                     const SysPaths& paths = {}) noexcept;

/**
 * @brief Compute device nodes tied to the target that currently exist.
 *
 * The per-GPU node (/dev/nvidiaN, or every /dev/nvidia[0-9]+ when the minor is
 * unknown) followed by the shared control and UVM nodes.
 */
[[nodiscard]] std::vector<std::string> computeDeviceNodes(const GpuTarget& target,
                                                          const SysPaths& paths = {}) noexcept;

/**
 * @brief DRM card nodes (/dev/dri/cardN) whose device is bound to a driver.
 * @param driver Driver basename, e.g. "nvidia".
 */
[[nodiscard]] std::vector<std::string> drmCardsForDriver(const std::string& driver,
                                                         const SysPaths& paths = {}) noexcept;

/**
 * @brief Probe both node sets for the target.
 */
[[nodiscard]] DeviceSurface probeDeviceSurface(const GpuTarget& target,
                                               const SysPaths& paths = {}) noexcept;

} // namespace gpu

} // namespace rebind

#endif // REBIND_GPU_GPU_TARGET_HPP
