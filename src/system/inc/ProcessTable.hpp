#ifndef REBIND_SYSTEM_PROCESS_TABLE_HPP
#define REBIND_SYSTEM_PROCESS_TABLE_HPP
/**
 * @file ProcessTable.hpp
 * @brief Process enumeration and signalling (device holders, names, kill).
 * @note Linux-only. Reads /proc/<pid>/{comm,cmdline,fd,stat} and /proc/uptime.
 *
 * The process calling into the table is never reported as a holder or a
 * command-line match, so a run can never target itself.
 */

#include <sys/types.h> // pid_t

#include <cstdint>  // std::uint64_t
#include <optional> // std::optional
#include <string>   // std::string
#include <utility>  // std::move
#include <vector>   // std::vector

namespace rebind {

namespace system {

/* ----------------------------- Constants ----------------------------- */

/// Default procfs mount point.
inline constexpr const char* PROC_ROOT = "/proc";

/* ----------------------------- ProcessTable ----------------------------- */

/**
 * @brief Process-table interface.
 */
class ProcessTable {
public:
  virtual ~ProcessTable() = default;

  /// Short command name (comm); nullopt if the process is gone or unreadable.
  [[nodiscard]] virtual std::optional<std::string> commandName(pid_t pid) = 0;

  /// Full command line with NUL separators replaced by spaces; nullopt if unreadable.
  [[nodiscard]] virtual std::optional<std::string> commandLine(pid_t pid) = 0;

  /**
   * @brief Pids holding an open descriptor on a path.
   * @param path Device node, e.g. "/dev/dri/card1".
   * @return Sorted unique pids; nullopt if the process list cannot be read.
   */
  [[nodiscard]] virtual std::optional<std::vector<pid_t>> holders(const std::string& path) = 0;

  /**
   * @brief Pids whose command line contains a match for an ECMAScript regex.
   * @return Sorted pids; empty if none or the pattern is invalid.
   */
  [[nodiscard]] virtual std::vector<pid_t> matchCommandLine(const std::string& pattern) = 0;

  /// Send SIGKILL. Returns false if the signal could not be delivered.
  [[nodiscard]] virtual bool kill(pid_t pid) = 0;
};

/* ----------------------------- procfs ----------------------------- */

/**
 * @brief ProcessTable backed by procfs and kill(2).
 */
class ProcfsProcessTable final : public ProcessTable {
public:
  /**
   * @param procRoot procfs root (tests pass a fake tree).
   * @param selfPid Pid excluded from holder and pattern scans; defaults to getpid().
   */
  explicit ProcfsProcessTable(std::string procRoot = PROC_ROOT, pid_t selfPid = 0);

  [[nodiscard]] std::optional<std::string> commandName(pid_t pid) override;
  [[nodiscard]] std::optional<std::string> commandLine(pid_t pid) override;
  [[nodiscard]] std::optional<std::vector<pid_t>> holders(const std::string& path) override;
  [[nodiscard]] std::vector<pid_t> matchCommandLine(const std::string& pattern) override;
  [[nodiscard]] bool kill(pid_t pid) override;

  /**
   * @brief Seconds since the process started.
   * @return nullopt if stat or uptime is unreadable.
   */
  [[nodiscard]] std::optional<std::uint64_t> elapsedSeconds(pid_t pid) const noexcept;

  /// All numeric entries under the procfs root, sorted; nullopt if the root is unreadable.
  [[nodiscard]] std::optional<std::vector<pid_t>> listPids() const noexcept;

private:
  [[nodiscard]] std::string pidPath(pid_t pid, const char* leaf) const;

  std::string procRoot_;
  pid_t selfPid_;
};

/**
 * @brief Extract the start time (clock ticks since boot) from /proc/<pid>/stat text.
 *
 * Field 22 counted after the closing parenthesis of the comm field, so comm
 * values containing spaces or parentheses parse correctly.
 */
[[nodiscard]] std::optional<std::uint64_t> parseStartTicks(const std::string& statText) noexcept;

} // namespace system

} // namespace rebind

#endif // REBIND_SYSTEM_PROCESS_TABLE_HPP
