/**
 * @file gpu-ps.cpp
 * @brief List GPU compute processes with utilization, memory and runtime.
 *
 * One line per process: GPU index, pid, GPU utilization, memory used by the
 * process, elapsed time and full command line. Fields that cannot be read
 * print as "?".
 */

#include "src/gpu/inc/GpuManagement.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/system/inc/ProcessTable.hpp"

#include <cstdint>     // std::uint8_t
#include <map>         // std::map
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

#include <fmt/core.h>

namespace gpu = rebind::gpu;
namespace format = rebind::helpers::format;

namespace {

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_DEVICE = 1,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "List processes running on NVIDIA GPUs with GPU index, utilization, memory and runtime.";

/// Build argument definitions.
rebind::helpers::args::ArgMap buildArgMap() {
  rebind::helpers::args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_DEVICE] = {"--device", 1, false, "GPU device index (default: all)"};
  return map;
}

/// Command line, else the driver's process name, else "?".
std::string commandFor(rebind::system::ProcfsProcessTable& table, const gpu::GpuProcess& proc) {
  if (const auto CMD = table.commandLine(proc.pid); CMD && !CMD->empty()) {
    return *CMD;
  }
  if (!proc.processName.empty()) {
    const std::size_t SLASH = proc.processName.rfind('/');
    return SLASH == std::string::npos ? proc.processName : proc.processName.substr(SLASH + 1);
  }
  return "?";
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const rebind::helpers::args::ArgMap ARG_MAP = buildArgMap();
  rebind::helpers::args::ParsedArgs pargs;
  int targetDevice = -1;

  if (argc > 1) {
    std::vector<std::string_view> args;
    args.reserve(static_cast<std::size_t>(argc - 1));
    for (int i = 1; i < argc; ++i) {
      args.emplace_back(argv[i]);
    }

    std::string error;
    if (!rebind::helpers::args::parseArgs(args, ARG_MAP, pargs, error)) {
      fmt::print(stderr, "Error: {}\n\n", error);
      rebind::helpers::args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
      return 1;
    }

    if (pargs.count(ARG_HELP) != 0) {
      rebind::helpers::args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
      return 0;
    }

    if (const auto V = rebind::helpers::args::firstValue(pargs, ARG_DEVICE)) {
      const auto INDEX = rebind::helpers::strings::parseInt(*V);
      if (!INDEX || *INDEX < 0) {
        fmt::print(stderr, "Error: invalid --device '{}'\n", *V);
        return 1;
      }
      targetDevice = static_cast<int>(*INDEX);
    }
  }

  const auto BACKEND = gpu::makeGpuManagement();
  const auto PROCS = BACKEND->allComputeProcesses();
  if (!PROCS) {
    fmt::print(stderr, "Error: cannot query GPU processes via {}\n", BACKEND->name());
    return 1;
  }

  std::map<int, gpu::GpuLiveStatus> byIndex;
  if (const auto STATUS = BACKEND->allLiveStatus()) {
    for (const gpu::GpuLiveStatus& s : *STATUS) {
      byIndex[s.index] = s;
    }
  }

  rebind::system::ProcfsProcessTable table;
  fmt::print("{:<4} {:<10} {:<6} {:<10} {:<10} {}\n", "GPU", "PID", "UTIL", "MEM", "TIME",
             "COMMAND");
  for (const gpu::GpuProcess& proc : *PROCS) {
    if (targetDevice >= 0 && proc.gpuIndex != targetDevice) {
      continue;
    }
    const auto IT = byIndex.find(proc.gpuIndex);
    const std::optional<unsigned> UTIL =
        IT != byIndex.end() ? IT->second.utilizationPercent : std::optional<unsigned>{};
    fmt::print("{:<4} {:<10} {:<6} {:<10} {:<10} {}\n",
               proc.gpuIndex >= 0 ? std::to_string(proc.gpuIndex) : std::string("?"), proc.pid,
               format::percent(UTIL), format::mebibytes(proc.usedMemoryBytes),
               format::elapsedHoursMinutes(table.elapsedSeconds(proc.pid)), commandFor(table, proc));
  }
  return 0;
}
