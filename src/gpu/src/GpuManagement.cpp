/**
 * @file GpuManagement.cpp
 * @brief NVML and nvidia-smi GPU management backends.
 */

#include "src/gpu/inc/GpuManagement.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/system/inc/Command.hpp"

#include <cstdlib>   // std::strtod
#include <exception> // std::exception
#include <utility>   // std::move
#include <vector>    // std::vector

#include <fmt/core.h>

#include "src/gpu/inc/compat_nvml_detect.hpp"

namespace rebind {

namespace gpu {

namespace {

using rebind::helpers::strings::parseInt;
using rebind::helpers::strings::splitLines;
using rebind::helpers::strings::startsWith;
using rebind::helpers::strings::trim;

constexpr std::uint64_t MIB = 1024ULL * 1024ULL;

/* ----------------------------- CSV Helpers ----------------------------- */

/// Split one CSV row on ',' keeping empty fields; fields are trimmed.
std::vector<std::string_view> csvFields(std::string_view row) {
  std::vector<std::string_view> out;
  std::size_t start = 0;
  for (;;) {
    const std::size_t COMMA = row.find(',', start);
    out.push_back(trim(row.substr(start, COMMA == std::string_view::npos ? row.npos : COMMA - start)));
    if (COMMA == std::string_view::npos) {
      break;
    }
    start = COMMA + 1;
  }
  return out;
}

/// nvidia-smi prints "[N/A]", "[Not Supported]" or "N/A" for missing values.
inline bool missing(std::string_view field) noexcept {
  return field.empty() || field.front() == '[' || field == "N/A";
}

std::optional<unsigned> unsignedField(std::string_view field) noexcept {
  if (missing(field)) {
    return std::nullopt;
  }
  const auto VALUE = parseInt(field);
  if (!VALUE || *VALUE < 0) {
    return std::nullopt;
  }
  return static_cast<unsigned>(*VALUE);
}

std::optional<double> doubleField(std::string_view field) {
  if (missing(field)) {
    return std::nullopt;
  }
  const std::string TEXT(field);
  char* end = nullptr;
  const double VALUE = std::strtod(TEXT.c_str(), &end);
  if (end == TEXT.c_str()) {
    return std::nullopt;
  }
  return VALUE;
}

std::optional<int> pstateField(std::string_view field) noexcept {
  if (missing(field) || !startsWith(field, "P")) {
    return std::nullopt;
  }
  const auto VALUE = parseInt(field.substr(1));
  if (!VALUE || *VALUE < 0) {
    return std::nullopt;
  }
  return static_cast<int>(*VALUE);
}

/// Canonical BDF, or the raw text if it does not parse.
std::string canonicalBdf(std::string_view text) {
  return normalizeBdf(std::string(text)).value_or(std::string(text));
}

/// Run nvidia-smi with captured output; nullopt on any failure.
std::optional<std::string> runSmi(const std::vector<std::string>& args) {
  std::vector<std::string> argv{"nvidia-smi"};
  argv.insert(argv.end(), args.begin(), args.end());
  const rebind::system::CommandResult RES = rebind::system::runCommand(argv);
  if (!RES.ok()) {
    return std::nullopt;
  }
  return RES.output;
}

const std::vector<std::string> SMI_STATUS_QUERY = {
    "--query-gpu=index,pci.bus_id,power.draw,utilization.gpu,fan.speed,pstate",
    "--format=csv,noheader,nounits"};

const std::vector<std::string> SMI_APPS_QUERY = {
    "--query-compute-apps=pid,process_name,gpu_bus_id,used_memory",
    "--format=csv,noheader,nounits"};

/* ----------------------------- NVML Helpers ----------------------------- */

#if COMPAT_NVML_AVAILABLE

/// RAII wrapper for NVML initialization.
class NvmlSession {
public:
  NvmlSession() noexcept : initialized_(nvmlInit_v2() == NVML_SUCCESS) {}
  ~NvmlSession() {
    if (initialized_)
      nvmlShutdown();
  }

  [[nodiscard]] bool valid() const noexcept { return initialized_; }

  NvmlSession(const NvmlSession&) = delete;
  NvmlSession& operator=(const NvmlSession&) = delete;

private:
  bool initialized_;
};

/// Device handle for a BDF; nullopt if NVML does not know it.
std::optional<nvmlDevice_t> nvmlHandle(const std::string& bdf) noexcept {
  nvmlDevice_t dev{};
  if (nvmlDeviceGetHandleByPciBusId_v2(bdf.c_str(), &dev) != NVML_SUCCESS) {
    return std::nullopt;
  }
  return dev;
}

/// Ordinal and canonical BDF of a device.
void nvmlIdentity(nvmlDevice_t dev, int& index, std::string& bdf) {
  unsigned int idx = 0;
  if (nvmlDeviceGetIndex(dev, &idx) == NVML_SUCCESS) {
    index = static_cast<int>(idx);
  }
  nvmlPciInfo_t pci{};
  if (nvmlDeviceGetPciInfo(dev, &pci) == NVML_SUCCESS) {
    bdf = canonicalBdf(pci.busId);
  }
}

/// Compute processes of one device; nullopt on query failure.
std::optional<std::vector<GpuProcess>> nvmlProcesses(nvmlDevice_t dev) {
  unsigned int count = 0;
  nvmlReturn_t rc = nvmlDeviceGetComputeRunningProcesses(dev, &count, nullptr);
  if (rc == NVML_SUCCESS) {
    return std::vector<GpuProcess>{};
  }
  if (rc != NVML_ERROR_INSUFFICIENT_SIZE) {
    return std::nullopt;
  }

  // Processes can start between the two calls.
  count += 8;
  std::vector<nvmlProcessInfo_t> infos(count);
  rc = nvmlDeviceGetComputeRunningProcesses(dev, &count, infos.data());
  if (rc != NVML_SUCCESS) {
    return std::nullopt;
  }

  int index = -1;
  std::string bdf;
  nvmlIdentity(dev, index, bdf);

  std::vector<GpuProcess> out;
  out.reserve(count);
  for (unsigned int i = 0; i < count; ++i) {
    GpuProcess proc{};
    proc.pid = static_cast<pid_t>(infos[i].pid);
    proc.gpuIndex = index;
    proc.pciBdf = bdf;
    if (infos[i].usedGpuMemory != static_cast<unsigned long long>(NVML_VALUE_NOT_AVAILABLE)) {
      proc.usedMemoryBytes = infos[i].usedGpuMemory;
    }
    out.push_back(std::move(proc));
  }
  return out;
}

GpuLiveStatus nvmlStatus(nvmlDevice_t dev) {
  GpuLiveStatus status{};
  nvmlIdentity(dev, status.index, status.pciBdf);

  unsigned int milliwatts = 0;
  if (nvmlDeviceGetPowerUsage(dev, &milliwatts) == NVML_SUCCESS) {
    status.powerDrawWatts = static_cast<double>(milliwatts) / 1000.0;
  }
  nvmlUtilization_t util{};
  if (nvmlDeviceGetUtilizationRates(dev, &util) == NVML_SUCCESS) {
    status.utilizationPercent = util.gpu;
  }
  unsigned int fan = 0;
  if (nvmlDeviceGetFanSpeed(dev, &fan) == NVML_SUCCESS) {
    status.fanSpeedPercent = fan;
  }
  nvmlPstates_t pstate = NVML_PSTATE_UNKNOWN;
  if (nvmlDeviceGetPerformanceState(dev, &pstate) == NVML_SUCCESS &&
      pstate != NVML_PSTATE_UNKNOWN) {
    status.pstate = static_cast<int>(pstate);
  }
  return status;
}

/// Handles of every device NVML enumerates.
std::vector<nvmlDevice_t> nvmlDevices() noexcept {
  std::vector<nvmlDevice_t> out;
  unsigned int count = 0;
  if (nvmlDeviceGetCount_v2(&count) != NVML_SUCCESS) {
    return out;
  }
  for (unsigned int i = 0; i < count; ++i) {
    nvmlDevice_t dev{};
    if (nvmlDeviceGetHandleByIndex_v2(i, &dev) == NVML_SUCCESS) {
      out.push_back(dev);
    }
  }
  return out;
}

#endif // COMPAT_NVML_AVAILABLE

} // namespace

/* ----------------------------- GpuLiveStatus ----------------------------- */

std::string GpuLiveStatus::toString() const {
  const std::string POWER = powerDrawWatts ? fmt::format("{:.2f} W", *powerDrawWatts)
                                           : std::string("[N/A]");
  const std::string UTIL =
      utilizationPercent ? fmt::format("{} %", *utilizationPercent) : std::string("[N/A]");
  const std::string FAN =
      fanSpeedPercent ? fmt::format("{} %", *fanSpeedPercent) : std::string("[N/A]");
  const std::string PSTATE = pstate ? fmt::format("P{}", *pstate) : std::string("[N/A]");
  return fmt::format("{}, {}, {}, {}, {}", index, POWER, UTIL, FAN, PSTATE);
}

/* ----------------------------- nvidia-smi parsing ----------------------------- */

std::vector<GpuLiveStatus> parseSmiGpuStatus(std::string_view csv) {
  std::vector<GpuLiveStatus> out;
  for (const std::string& line : splitLines(csv)) {
    const std::vector<std::string_view> F = csvFields(line);
    if (F.size() < 6) {
      continue;
    }
    const auto INDEX = parseInt(F[0]);
    if (!INDEX) {
      continue;
    }
    GpuLiveStatus status{};
    status.index = static_cast<int>(*INDEX);
    status.pciBdf = canonicalBdf(F[1]);
    status.powerDrawWatts = doubleField(F[2]);
    status.utilizationPercent = unsignedField(F[3]);
    status.fanSpeedPercent = unsignedField(F[4]);
    status.pstate = pstateField(F[5]);
    out.push_back(std::move(status));
  }
  return out;
}

std::vector<GpuProcess> parseSmiComputeApps(std::string_view csv) {
  std::vector<GpuProcess> out;
  for (const std::string& line : splitLines(csv)) {
    const std::vector<std::string_view> F = csvFields(line);
    if (F.size() < 4) {
      continue;
    }
    const auto PID = parseInt(F.front());
    if (!PID || *PID <= 0) {
      continue;
    }
    GpuProcess proc{};
    proc.pid = static_cast<pid_t>(*PID);
    proc.pciBdf = canonicalBdf(F[F.size() - 2]);
    if (const auto MEM = unsignedField(F.back())) {
      proc.usedMemoryBytes = static_cast<std::uint64_t>(*MEM) * MIB;
    }
    // Process names may themselves contain commas.
    const std::string_view ROW(line);
    const std::size_t NAME_BEGIN = ROW.find(',') + 1;
    std::size_t nameEnd = ROW.size();
    for (int i = 0; i < 2; ++i) {
      nameEnd = ROW.rfind(',', nameEnd - 1);
    }
    proc.processName = std::string(trim(ROW.substr(NAME_BEGIN, nameEnd - NAME_BEGIN)));
    out.push_back(std::move(proc));
  }
  return out;
}

void assignGpuIndices(std::vector<GpuProcess>& procs, const std::vector<GpuLiveStatus>& gpus) {
  for (GpuProcess& proc : procs) {
    for (const GpuLiveStatus& gpu : gpus) {
      if (gpu.pciBdf == proc.pciBdf) {
        proc.gpuIndex = gpu.index;
        break;
      }
    }
  }
}

/* ----------------------------- SmiGpuManagement ----------------------------- */

std::optional<std::vector<GpuProcess>> SmiGpuManagement::computeProcesses(const GpuTarget& target) {
  auto all = allComputeProcesses();
  if (!all) {
    return std::nullopt;
  }
  std::vector<GpuProcess> out;
  for (GpuProcess& proc : *all) {
    if (proc.pciBdf == target.pciBdf) {
      out.push_back(std::move(proc));
    }
  }
  return out;
}

std::optional<std::vector<GpuProcess>> SmiGpuManagement::allComputeProcesses() {
  const auto APPS = runSmi(SMI_APPS_QUERY);
  if (!APPS) {
    return std::nullopt;
  }
  std::vector<GpuProcess> procs = parseSmiComputeApps(*APPS);
  if (const auto GPUS = allLiveStatus()) {
    assignGpuIndices(procs, *GPUS);
  }
  return procs;
}

std::optional<GpuLiveStatus> SmiGpuManagement::liveStatus(const GpuTarget& target) {
  const auto ALL = allLiveStatus();
  if (!ALL) {
    return std::nullopt;
  }
  for (const GpuLiveStatus& status : *ALL) {
    if (status.pciBdf == target.pciBdf) {
      return status;
    }
  }
  return std::nullopt;
}

std::optional<std::vector<GpuLiveStatus>> SmiGpuManagement::allLiveStatus() {
  const auto TEXT = runSmi(SMI_STATUS_QUERY);
  if (!TEXT) {
    return std::nullopt;
  }
  return parseSmiGpuStatus(*TEXT);
}

bool SmiGpuManagement::disablePersistence(const GpuTarget& target) {
  return runSmi({"-i", target.pciBdf, "-pm", "0"}).has_value();
}

/* ----------------------------- NvmlGpuManagement ----------------------------- */

std::optional<std::vector<GpuProcess>> NvmlGpuManagement::computeProcesses(const GpuTarget& target) {
#if COMPAT_NVML_AVAILABLE
  NvmlSession session;
  if (!session.valid()) {
    return std::nullopt;
  }
  const auto DEV = nvmlHandle(target.pciBdf);
  if (!DEV) {
    return std::nullopt;
  }
  return nvmlProcesses(*DEV);
#else
  (void)target;
  return std::nullopt;
#endif
}

std::optional<std::vector<GpuProcess>> NvmlGpuManagement::allComputeProcesses() {
#if COMPAT_NVML_AVAILABLE
  NvmlSession session;
  if (!session.valid()) {
    return std::nullopt;
  }
  std::vector<GpuProcess> out;
  for (nvmlDevice_t dev : nvmlDevices()) {
    if (auto procs = nvmlProcesses(dev)) {
      out.insert(out.end(), procs->begin(), procs->end());
    }
  }
  return out;
#else
  return std::nullopt;
#endif
}

std::optional<GpuLiveStatus> NvmlGpuManagement::liveStatus(const GpuTarget& target) {
#if COMPAT_NVML_AVAILABLE
  NvmlSession session;
  if (!session.valid()) {
    return std::nullopt;
  }
  const auto DEV = nvmlHandle(target.pciBdf);
  if (!DEV) {
    return std::nullopt;
  }
  return nvmlStatus(*DEV);
#else
  (void)target;
  return std::nullopt;
#endif
}

std::optional<std::vector<GpuLiveStatus>> NvmlGpuManagement::allLiveStatus() {
#if COMPAT_NVML_AVAILABLE
  NvmlSession session;
  if (!session.valid()) {
    return std::nullopt;
  }
  std::vector<GpuLiveStatus> out;
  for (nvmlDevice_t dev : nvmlDevices()) {
    out.push_back(nvmlStatus(dev));
  }
  return out;
#else
  return std::nullopt;
#endif
}

bool NvmlGpuManagement::disablePersistence(const GpuTarget& target) {
#if COMPAT_NVML_AVAILABLE
  NvmlSession session;
  if (!session.valid()) {
    return false;
  }
  const auto DEV = nvmlHandle(target.pciBdf);
  if (!DEV) {
    return false;
  }
  return nvmlDeviceSetPersistenceMode(*DEV, NVML_FEATURE_DISABLED) == NVML_SUCCESS;
#else
  (void)target;
  return false;
#endif
}

/* ----------------------------- Factory ----------------------------- */

std::unique_ptr<GpuManagement> makeGpuManagement() {
#if COMPAT_NVML_AVAILABLE
  return std::make_unique<NvmlGpuManagement>();
#else
  return std::make_unique<SmiGpuManagement>();
#endif
}

} // namespace gpu

} // namespace rebind
