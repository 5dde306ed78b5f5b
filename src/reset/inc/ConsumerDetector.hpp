#ifndef REBIND_RESET_CONSUMER_DETECTOR_HPP
#define REBIND_RESET_CONSUMER_DETECTOR_HPP
/**
 * @file ConsumerDetector.hpp
 * @brief Find the processes bound to the target GPU.
 *
 * Three providers are merged in order, first source wins for a pid:
 *  1. Management interface compute processes.
 *  2. Holders of the driver's DRM card nodes, kept only when the command name
 *     matches the display-server pattern.
 *  3. Holders of the target's compute device nodes.
 *
 * Detection is read-only. A provider that cannot answer contributes nothing
 * and is reported as a DetectionDegraded fault.
 */

#include "src/gpu/inc/GpuManagement.hpp"
#include "src/gpu/inc/GpuTarget.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/reset/inc/ResetTypes.hpp"
#include "src/system/inc/ProcessTable.hpp"

#include <optional> // std::optional
#include <regex>    // std::regex
#include <string>   // std::string
#include <vector>   // std::vector

namespace rebind {

namespace reset {

/* ----------------------------- Constants ----------------------------- */

/// Command names of display servers and compositors.
inline constexpr const char* DEFAULT_DISPLAY_PROCESS_PATTERN =
    "^(Xorg|X|gnome-shell|kwin|mutter|composit|weston|sway|hyprland|picom).*$";

/* ----------------------------- ConsumerClassifier ----------------------------- */

/**
 * @brief Classify a process by its command name.
 */
class ConsumerClassifier {
public:
  /// @param displayPattern ECMAScript regex; an invalid pattern matches nothing.
  explicit ConsumerClassifier(const std::string& displayPattern = DEFAULT_DISPLAY_PROCESS_PATTERN);

  /// False if the pattern failed to compile.
  [[nodiscard]] bool valid() const noexcept { return valid_; }

  /// True if the name matches the display pattern.
  [[nodiscard]] bool isDisplayServer(const std::string& name) const noexcept;

  /// DisplayServer, Compute, or Unknown when the name is unavailable.
  [[nodiscard]] ConsumerClass classify(const std::optional<std::string>& name) const noexcept;

private:
  std::regex pattern_;
  bool valid_{false};
};

/* ----------------------------- Detection ----------------------------- */

/**
 * @brief Merged detection output.
 */
struct DetectionResult {
  std::vector<ConsumerRecord> consumers; ///< Unique by pid, in discovery order
  std::vector<Fault> faults;             ///< DetectionDegraded entries

  /// True if any record is a display server.
  [[nodiscard]] bool hasDisplayServer() const noexcept;
};

/**
 * @brief Merges the providers into one consumer list.
 */
class ConsumerDetector {
public:
  ConsumerDetector(gpu::GpuManagement& gpu, system::ProcessTable& processes,
                   const ConsumerClassifier& classifier, helpers::log::Logger& log) noexcept
      : gpu_(gpu), processes_(processes), classifier_(classifier), log_(log) {}

  /**
   * @brief Detect consumers of the target.
   * @param target  The GPU.
   * @param surface Its DRM card and compute device nodes.
   */
  [[nodiscard]] DetectionResult detect(const gpu::GpuTarget& target,
                                       const gpu::DeviceSurface& surface);

private:
  void add(DetectionResult& result, ConsumerRecord record);

  gpu::GpuManagement& gpu_;
  system::ProcessTable& processes_;
  const ConsumerClassifier& classifier_;
  helpers::log::Logger& log_;
};

} // namespace reset

} // namespace rebind

#endif // REBIND_RESET_CONSUMER_DETECTOR_HPP
