#ifndef REBIND_HELPERS_STRINGS_HPP
#define REBIND_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief String helpers for procfs/sysfs text and CLI values.
 *
 * Small, allocation-light helpers shared by the system, gpu and reset modules.
 * Parsing helpers operate on std::string_view and never throw.
 */

#include <cstddef>
#include <cstdint>
#include <cstdlib> // strtol
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rebind {
namespace helpers {
namespace strings {

/* ----------------------------- Trimming ----------------------------- */

/**
 * @brief Strip leading and trailing whitespace (space, tab, CR, LF).
 * @param text Input view.
 * @return Sub-view without surrounding whitespace.
 */
[[nodiscard]] inline std::string_view trim(std::string_view text) noexcept {
  const auto IS_SPACE = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
  while (!text.empty() && IS_SPACE(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && IS_SPACE(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

/* ----------------------------- Splitting ----------------------------- */

/**
 * @brief Split on a delimiter, trimming each token and dropping empty ones.
 * @param text Input text (e.g. "nvidia_uvm, nvidia_drm").
 * @param delim Delimiter character.
 * @return Owned tokens in input order.
 */
[[nodiscard]] inline std::vector<std::string> split(std::string_view text, char delim) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start <= text.size()) {
    std::size_t end = text.find(delim, start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    const std::string_view TOKEN = trim(text.substr(start, end - start));
    if (!TOKEN.empty()) {
      out.emplace_back(TOKEN);
    }
    start = end + 1;
  }
  return out;
}

/**
 * @brief Split text into lines, dropping blank lines.
 */
[[nodiscard]] inline std::vector<std::string> splitLines(std::string_view text) {
  return split(text, '\n');
}

/**
 * @brief Join tokens with a separator.
 */
[[nodiscard]] inline std::string join(const std::vector<std::string>& parts,
                                      std::string_view sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out.append(sep);
    }
    out.append(parts[i]);
  }
  return out;
}

/* ----------------------------- Predicates ----------------------------- */

/**
 * @brief Check if string starts with prefix.
 */
[[nodiscard]] inline bool startsWith(std::string_view str, std::string_view prefix) noexcept {
  return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

/**
 * @brief Check that every character is a decimal digit (and there is at least one).
 * @note Used to pick pid entries out of /proc.
 */
[[nodiscard]] inline bool isAllDigits(std::string_view str) noexcept {
  if (str.empty()) {
    return false;
  }
  for (const char C : str) {
    if (C < '0' || C > '9') {
      return false;
    }
  }
  return true;
}

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Parse a base-10 signed integer, requiring the whole token to be consumed.
 * @param text Token (surrounding whitespace allowed).
 * @return Value, or std::nullopt on empty/invalid input.
 */
[[nodiscard]] inline std::optional<std::int64_t> parseInt(std::string_view text) noexcept {
  const std::string_view TOKEN = trim(text);
  if (TOKEN.empty() || TOKEN.size() > 20) {
    return std::nullopt;
  }

  char buf[24] = {};
  TOKEN.copy(buf, TOKEN.size());

  char* end = nullptr;
  const long long VAL = std::strtoll(buf, &end, 10);
  if (end == buf || *end != '\0') {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(VAL);
}

} // namespace strings
} // namespace helpers
} // namespace rebind

#endif // REBIND_HELPERS_STRINGS_HPP
