/**
 * @file GpuTarget.cpp
 * @brief sysfs/procfs target resolution.
 */

#include "src/gpu/inc/GpuTarget.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <algorithm> // std::sort
#include <cctype>    // std::tolower, std::isxdigit
#include <exception> // std::exception

#include <fmt/core.h>

namespace rebind {

namespace gpu {

namespace {

using rebind::helpers::files::listDirectory;
using rebind::helpers::files::pathExists;
using rebind::helpers::files::readFile;
using rebind::helpers::files::readFirstLine;
using rebind::helpers::files::readLinkBasename;
using rebind::helpers::strings::isAllDigits;
using rebind::helpers::strings::parseInt;
using rebind::helpers::strings::splitLines;
using rebind::helpers::strings::startsWith;
using rebind::helpers::strings::trim;

/// Shared nodes opened by every CUDA/NVML client.
constexpr const char* SHARED_NODES[] = {"nvidiactl", "nvidia-uvm", "nvidia-uvm-tools"};

inline std::string pciDevicesDir(const SysPaths& paths) { return paths.sys + "/bus/pci/devices"; }

/// True if every char in [pos, pos+len) is a hex digit.
inline bool hexRun(const std::string& s, std::size_t pos, std::size_t len) noexcept {
  if (pos + len > s.size()) {
    return false;
  }
  for (std::size_t i = pos; i < pos + len; ++i) {
    if (std::isxdigit(static_cast<unsigned char>(s[i])) == 0) {
      return false;
    }
  }
  return true;
}

} // namespace

/* ----------------------------- GpuTarget ----------------------------- */

std::string GpuTarget::toString() const {
  return fmt::format("GPU {} ({}) minor={}", deviceIndex, pciBdf,
                     deviceMinor ? std::to_string(*deviceMinor) : std::string("?"));
}

/* ----------------------------- API ----------------------------- */

std::optional<std::string> normalizeBdf(const std::string& text) {
  std::string bdf(trim(text));
  for (char& c : bdf) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  // bus:dev.fn without a domain
  if (bdf.size() == 7) {
    bdf = "0000:" + bdf;
  }
  // NVML reports an 8-digit domain ("00000000:65:00.0")
  if (bdf.size() == 16 && startsWith(bdf, "0000")) {
    bdf.erase(0, 4);
  }
  if (bdf.size() != 12 || bdf[4] != ':' || bdf[7] != ':' || bdf[10] != '.' ||
      !hexRun(bdf, 0, 4) || !hexRun(bdf, 5, 2) || !hexRun(bdf, 8, 2) || !hexRun(bdf, 11, 1)) {
    return std::nullopt;
  }
  return bdf;
}

std::vector<std::string> listNvidiaGpus(const SysPaths& paths) noexcept {
  std::vector<std::string> out;
  try {
    const std::string ROOT = pciDevicesDir(paths);
    for (const std::string& entry : listDirectory(ROOT)) {
      const auto VENDOR = readFirstLine(ROOT + "/" + entry + "/vendor");
      const auto CLASS = readFirstLine(ROOT + "/" + entry + "/class");
      if (!VENDOR || !CLASS || *VENDOR != NVIDIA_PCI_VENDOR) {
        continue;
      }
      // 0x03xxxx: display controller (VGA or 3D)
      if (!startsWith(*CLASS, "0x03")) {
        continue;
      }
      out.push_back(entry);
    }
    std::sort(out.begin(), out.end());
  } catch (const std::exception&) {
    out.clear();
  }
  return out;
}

std::optional<int> readDeviceMinor(const std::string& bdf, const SysPaths& paths) noexcept {
  try {
    const auto TEXT = readFile(paths.proc + "/driver/nvidia/gpus/" + bdf + "/information");
    if (!TEXT) {
      return std::nullopt;
    }
    for (const std::string& line : splitLines(*TEXT)) {
      const std::size_t COLON = line.find(':');
      if (COLON == std::string::npos || trim(std::string_view(line).substr(0, COLON)) != "Device Minor") {
        continue;
      }
      const auto VALUE = parseInt(trim(std::string_view(line).substr(COLON + 1)));
      if (VALUE && *VALUE >= 0) {
        return static_cast<int>(*VALUE);
      }
    }
  } catch (const std::exception&) {
    return std::nullopt;
  }
  return std::nullopt;
}

std::optional<GpuTarget> resolveTarget(const TargetSelector& selector,
                                       const SysPaths& paths) noexcept {
  try {
    const std::vector<std::string> GPUS = listNvidiaGpus(paths);
    GpuTarget target{};

    if (selector.pciBdf) {
      const auto BDF = normalizeBdf(*selector.pciBdf);
      if (!BDF) {
        return std::nullopt;
      }
      const auto IT = std::find(GPUS.begin(), GPUS.end(), *BDF);
      if (IT == GPUS.end()) {
        return std::nullopt;
      }
      target.deviceIndex = static_cast<int>(IT - GPUS.begin());
      target.pciBdf = *BDF;
    } else {
      const int INDEX = selector.deviceIndex.value_or(0);
      if (INDEX < 0 || static_cast<std::size_t>(INDEX) >= GPUS.size()) {
        return std::nullopt;
      }
      target.deviceIndex = INDEX;
      target.pciBdf = GPUS[static_cast<std::size_t>(INDEX)];
    }

    target.deviceMinor = readDeviceMinor(target.pciBdf, paths);
    return target;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::vector<std::string> computeDeviceNodes(const GpuTarget& target,
                                            const SysPaths& paths) noexcept {
  std::vector<std::string> out;
  try {
    if (target.deviceMinor) {
      const std::string NODE = fmt::format("{}/nvidia{}", paths.dev, *target.deviceMinor);
      if (pathExists(NODE)) {
        out.push_back(NODE);
      }
    } else {
      std::vector<std::string> perGpu;
      for (const std::string& entry : listDirectory(paths.dev)) {
        if (entry.size() > 6 && startsWith(entry, "nvidia") &&
            isAllDigits(std::string_view(entry).substr(6))) {
          perGpu.push_back(paths.dev + "/" + entry);
        }
      }
      std::sort(perGpu.begin(), perGpu.end());
      out.insert(out.end(), perGpu.begin(), perGpu.end());
    }
    for (const char* shared : SHARED_NODES) {
      const std::string NODE = paths.dev + "/" + shared;
      if (pathExists(NODE)) {
        out.push_back(NODE);
      }
    }
  } catch (const std::exception&) {
    out.clear();
  }
  return out;
}

std::vector<std::string> drmCardsForDriver(const std::string& driver,
                                           const SysPaths& paths) noexcept {
  std::vector<std::string> out;
  try {
    const std::string DRM = paths.sys + "/class/drm";
    for (const std::string& entry : listDirectory(DRM)) {
      // card0, card1 ... but not card0-HDMI-A-1 connectors
      if (entry.size() <= 4 || !startsWith(entry, "card") ||
          !isAllDigits(std::string_view(entry).substr(4))) {
        continue;
      }
      const auto OWNER = readLinkBasename(DRM + "/" + entry + "/device/driver");
      if (OWNER && *OWNER == driver) {
        out.push_back(paths.dev + "/dri/" + entry);
      }
    }
    std::sort(out.begin(), out.end());
  } catch (const std::exception&) {
    out.clear();
  }
  return out;
}

DeviceSurface probeDeviceSurface(const GpuTarget& target, const SysPaths& paths) noexcept {
  DeviceSurface surface;
  surface.drmCards = drmCardsForDriver(NVIDIA_DRIVER, paths);
  surface.computeNodes = computeDeviceNodes(target, paths);
  return surface;
}

} // namespace gpu

} // namespace rebind
