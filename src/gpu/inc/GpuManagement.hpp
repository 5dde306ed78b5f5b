#ifndef REBIND_GPU_GPU_MANAGEMENT_HPP
#define REBIND_GPU_GPU_MANAGEMENT_HPP
/**
 * @file GpuManagement.hpp
 * @brief GPU management interface: compute processes, live status, persistence.
 * @note Two backends. NVML when the build has it (COMPAT_NVML_AVAILABLE),
 *       otherwise the nvidia-smi CLI through system::runCommand.
 *
 * Every query distinguishes "nothing found" (empty vector) from "could not
 * ask" (nullopt), so callers can record a degraded source.
 */

#include "src/gpu/inc/GpuTarget.hpp"

#include <sys/types.h> // pid_t

#include <cstdint>     // std::uint64_t
#include <memory>      // std::unique_ptr
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

namespace rebind {

namespace gpu {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief One compute process on a GPU.
 */
struct GpuProcess {
  pid_t pid{0};                                ///< Host pid
  int gpuIndex{-1};                            ///< GPU ordinal; -1 if unknown
  std::string pciBdf;                          ///< GPU the process runs on
  std::string processName;                     ///< Name as the driver reports it (may be empty)
  std::optional<std::uint64_t> usedMemoryBytes; ///< Framebuffer memory used by the process
};

/**
 * @brief Live device status as printed after a successful reload.
 */
struct GpuLiveStatus {
  int index{-1};                              ///< GPU ordinal
  std::string pciBdf;                         ///< PCI address
  std::optional<double> powerDrawWatts;       ///< Board power draw
  std::optional<unsigned> utilizationPercent; ///< GPU utilization
  std::optional<unsigned> fanSpeedPercent;    ///< Fan speed (absent on passively cooled boards)
  std::optional<int> pstate;                  ///< Performance state (0 = P0)

  /// @brief "0, 35.12 W, 3 %, 30 %, P8" with "[N/A]" for missing fields.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- GpuManagement ----------------------------- */

/**
 * @brief GPU management interface.
 */
class GpuManagement {
public:
  virtual ~GpuManagement() = default;

  /// Backend name for logs ("nvml", "nvidia-smi").
  [[nodiscard]] virtual const char* name() const noexcept = 0;

  /// Compute processes on the target; nullopt if the backend is unavailable.
  [[nodiscard]] virtual std::optional<std::vector<GpuProcess>>
  computeProcesses(const GpuTarget& target) = 0;

  /// Compute processes on every GPU; nullopt if the backend is unavailable.
  [[nodiscard]] virtual std::optional<std::vector<GpuProcess>> allComputeProcesses() = 0;

  /// Live status of the target; nullopt if unavailable.
  [[nodiscard]] virtual std::optional<GpuLiveStatus> liveStatus(const GpuTarget& target) = 0;

  /// Live status of every GPU; nullopt if unavailable.
  [[nodiscard]] virtual std::optional<std::vector<GpuLiveStatus>> allLiveStatus() = 0;

  /// Turn persistence mode off. Returns false on failure.
  [[nodiscard]] virtual bool disablePersistence(const GpuTarget& target) = 0;
};

/**
 * @brief NVML backend. Every call opens and closes its own NVML session.
 */
class NvmlGpuManagement final : public GpuManagement {
public:
  [[nodiscard]] const char* name() const noexcept override { return "nvml"; }
  [[nodiscard]] std::optional<std::vector<GpuProcess>>
  computeProcesses(const GpuTarget& target) override;
  [[nodiscard]] std::optional<std::vector<GpuProcess>> allComputeProcesses() override;
  [[nodiscard]] std::optional<GpuLiveStatus> liveStatus(const GpuTarget& target) override;
  [[nodiscard]] std::optional<std::vector<GpuLiveStatus>> allLiveStatus() override;
  [[nodiscard]] bool disablePersistence(const GpuTarget& target) override;
};

/**
 * @brief nvidia-smi backend.
 */
class SmiGpuManagement final : public GpuManagement {
public:
  [[nodiscard]] const char* name() const noexcept override { return "nvidia-smi"; }
  [[nodiscard]] std::optional<std::vector<GpuProcess>>
  computeProcesses(const GpuTarget& target) override;
  [[nodiscard]] std::optional<std::vector<GpuProcess>> allComputeProcesses() override;
  [[nodiscard]] std::optional<GpuLiveStatus> liveStatus(const GpuTarget& target) override;
  [[nodiscard]] std::optional<std::vector<GpuLiveStatus>> allLiveStatus() override;
  [[nodiscard]] bool disablePersistence(const GpuTarget& target) override;
};

/// Backend the build supports best (NVML if compiled in, else nvidia-smi).
[[nodiscard]] std::unique_ptr<GpuManagement> makeGpuManagement();

/* ----------------------------- nvidia-smi parsing ----------------------------- */

/**
 * @brief Parse `--query-gpu=index,pci.bus_id,power.draw,utilization.gpu,fan.speed,pstate
 *        --format=csv,noheader,nounits` output.
 */
[[nodiscard]] std::vector<GpuLiveStatus> parseSmiGpuStatus(std::string_view csv);

/**
 * @brief Parse `--query-compute-apps=pid,process_name,gpu_bus_id,used_memory
 *        --format=csv,noheader,nounits` output.
 */
[[nodiscard]] std::vector<GpuProcess> parseSmiComputeApps(std::string_view csv);

/**
 * @brief Fill GpuProcess::gpuIndex by matching BDFs against a status list.
 */
void assignGpuIndices(std::vector<GpuProcess>& procs, const std::vector<GpuLiveStatus>& gpus);

} // namespace gpu

} // namespace rebind

#endif // REBIND_GPU_GPU_MANAGEMENT_HPP
