#ifndef REBIND_SYSTEM_COMMAND_HPP
#define REBIND_SYSTEM_COMMAND_HPP
/**
 * @file Command.hpp
 * @brief Run external programs (systemctl, modprobe, systemd-run) without a shell.
 * @note Linux-only. Uses fork/execvp/waitpid; arguments are never shell-expanded.
 * @note NOT RT-safe: forks and allocates.
 */

#include <string>
#include <vector>

namespace rebind {

namespace system {

/* ----------------------------- CommandResult ----------------------------- */

/**
 * @brief Outcome of one external command.
 */
struct CommandResult {
  bool launched{false}; ///< False if the program could not be executed at all
  int exitCode{-1};     ///< Exit status; 128+N if killed by signal N
  int execErrno{0};     ///< errno from execvp when launched == false
  std::string output;   ///< Captured stdout+stderr (empty when not captured)

  /// @brief True if launched and exited with status 0.
  [[nodiscard]] bool ok() const noexcept { return launched && exitCode == 0; }

  /// @brief First line of the output, or a launch error description.
  [[nodiscard]] std::string summary() const;
};

/* ----------------------------- Output Mode ----------------------------- */

/**
 * @brief Where the child's stdout/stderr go.
 */
enum class OutputMode : unsigned char {
  Capture = 0, ///< Collected into CommandResult::output
  Inherit = 1, ///< Passed through to the caller's stdout/stderr
  Discard = 2  ///< Sent to /dev/null
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Run a program and wait for it.
 * @param argv Program and arguments; argv[0] is looked up on PATH.
 * @param mode Output handling.
 * @return Result; never throws.
 *
 * waitpid() is retried on EINTR.
 */
[[nodiscard]] CommandResult runCommand(const std::vector<std::string>& argv,
                                       OutputMode mode = OutputMode::Capture) noexcept;

/**
 * @brief Replace the current process image (execvp).
 * @return errno on failure; does not return on success.
 */
[[nodiscard]] int execReplace(const std::vector<std::string>& argv) noexcept;

/**
 * @brief Absolute path of the running executable (/proc/self/exe).
 * @return Path, or empty on failure.
 */
[[nodiscard]] std::string selfExecutablePath() noexcept;

} // namespace system

} // namespace rebind

#endif // REBIND_SYSTEM_COMMAND_HPP
