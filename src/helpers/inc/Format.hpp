#ifndef REBIND_HELPERS_FORMAT_HPP
#define REBIND_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Human-readable formatting for tool output (elapsed time, memory).
 *
 * @note Cold-path only: all functions return std::string.
 */

#include <cstdint>
#include <optional>
#include <string>

#include <fmt/core.h>

namespace rebind {
namespace helpers {
namespace format {

/* ----------------------------- API ----------------------------- */

/**
 * @brief Format an elapsed duration as hours and zero-padded minutes.
 * @param seconds Elapsed seconds; std::nullopt prints "?".
 * @return e.g. "3h07m".
 */
[[nodiscard]] inline std::string elapsedHoursMinutes(std::optional<std::uint64_t> seconds) {
  if (!seconds) {
    return "?";
  }
  const std::uint64_t HOURS = *seconds / 3600;
  const std::uint64_t MINS = (*seconds % 3600) / 60;
  return fmt::format("{}h{:02}m", HOURS, MINS);
}

/**
 * @brief Format a byte count in whole MiB, as nvidia-smi reports memory.
 * @return e.g. "1024MiB", or "?" when unknown.
 */
[[nodiscard]] inline std::string mebibytes(std::optional<std::uint64_t> bytes) {
  if (!bytes) {
    return "?";
  }
  return fmt::format("{}MiB", *bytes / (1024ULL * 1024ULL));
}

/**
 * @brief Format a percentage, or "?" when unknown.
 */
[[nodiscard]] inline std::string percent(std::optional<unsigned int> value) {
  if (!value) {
    return "?";
  }
  return fmt::format("{}%", *value);
}

} // namespace format
} // namespace helpers
} // namespace rebind

#endif // REBIND_HELPERS_FORMAT_HPP
