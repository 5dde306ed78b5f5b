#ifndef REBIND_RESET_PROCESS_REAPER_HPP
#define REBIND_RESET_PROCESS_REAPER_HPP
/**
 * @file ProcessReaper.hpp
 * @brief Forcibly terminate compute consumers and GPU watchers.
 *
 * Display servers are never signalled: they are released by stopping their
 * service or left for the operator. Unknown consumers are spared as well.
 */

#include "src/helpers/inc/Log.hpp"
#include "src/reset/inc/ConsumerDetector.hpp"
#include "src/reset/inc/ResetTypes.hpp"
#include "src/system/inc/ProcessTable.hpp"

#include <sys/types.h> // pid_t

#include <string> // std::string
#include <vector> // std::vector

namespace rebind {

namespace reset {

/// Command lines of monitoring loops that keep the device open.
inline constexpr const char* DEFAULT_WATCHER_PATTERN = "watch.*nvidia-smi";

/**
 * @brief Pids by what happened to them.
 */
struct ReapReport {
  std::vector<pid_t> killed; ///< SIGKILL delivered
  std::vector<pid_t> spared; ///< Display servers and unknown consumers
  std::vector<pid_t> failed; ///< Signal not delivered (usually already gone)
};

class ProcessReaper {
public:
  ProcessReaper(system::ProcessTable& processes, const ConsumerClassifier& classifier,
                helpers::log::Logger& log) noexcept
      : processes_(processes), classifier_(classifier), log_(log) {}

  /// SIGKILL every Compute record.
  [[nodiscard]] ReapReport reap(const std::vector<ConsumerRecord>& consumers);

  /// SIGKILL processes whose command line matches any pattern, except display servers.
  [[nodiscard]] ReapReport reapWatchers(const std::vector<std::string>& patterns);

private:
  void killOne(pid_t pid, const std::string& name, ReapReport& report);

  system::ProcessTable& processes_;
  const ConsumerClassifier& classifier_;
  helpers::log::Logger& log_;
};

} // namespace reset

} // namespace rebind

#endif // REBIND_RESET_PROCESS_REAPER_HPP
