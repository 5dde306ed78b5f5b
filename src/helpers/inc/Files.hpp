#ifndef REBIND_HELPERS_FILES_HPP
#define REBIND_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief File, symlink and directory helpers for procfs/sysfs/devfs access.
 *
 * Reads use C-style open/read/close; no descriptor outlives the call.
 *
 * @note All helpers are noexcept and report failure through empty results.
 */

#include "src/helpers/inc/Strings.hpp"

#include <dirent.h>   // opendir, readdir, closedir
#include <fcntl.h>    // open, O_RDONLY, O_CLOEXEC
#include <sys/stat.h> // stat
#include <unistd.h>   // read, close, readlink

#include <array>
#include <cstddef>
#include <exception>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rebind {
namespace helpers {
namespace files {

/* ----------------------------- Constants ----------------------------- */

/// Upper bound on bytes read by readFile() (procfs files are small).
inline constexpr std::size_t MAX_READ_BYTES = 1U << 20;

/// Buffer size for readlink().
inline constexpr std::size_t LINK_BUFFER_SIZE = 4096;

/* ----------------------------- File Reading ----------------------------- */

/**
 * @brief Read a whole file into a string.
 * @param path File path.
 * @return Contents, or std::nullopt if the file cannot be opened.
 *
 * Embedded NUL bytes are preserved (needed for /proc/<pid>/cmdline).
 */
[[nodiscard]] inline std::optional<std::string> readFile(const std::string& path) noexcept {
  const int FD = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return std::nullopt;
  }

  std::string out;
  try {
    std::array<char, 4096> buf{};
    while (out.size() < MAX_READ_BYTES) {
      const ssize_t N = ::read(FD, buf.data(), buf.size());
      if (N <= 0) {
        break;
      }
      out.append(buf.data(), static_cast<std::size_t>(N));
    }
  } catch (const std::exception&) {
    ::close(FD);
    return std::nullopt;
  }

  ::close(FD);
  return out;
}

/**
 * @brief Read the first line of a file, trimmed.
 * @return Line, or std::nullopt on error.
 */
[[nodiscard]] inline std::optional<std::string> readFirstLine(const std::string& path) noexcept {
  const std::optional<std::string> CONTENT = readFile(path);
  if (!CONTENT) {
    return std::nullopt;
  }
  const std::size_t NL = CONTENT->find('\n');
  return std::string(strings::trim(std::string_view(*CONTENT).substr(0, NL)));
}

/* ----------------------------- Links ----------------------------- */

/**
 * @brief Resolve a symlink one level.
 * @return Link target, or std::nullopt if path is not a readable symlink.
 */
[[nodiscard]] inline std::optional<std::string> readLink(const std::string& path) noexcept {
  std::array<char, LINK_BUFFER_SIZE> buf{};
  const ssize_t N = ::readlink(path.c_str(), buf.data(), buf.size() - 1);
  if (N < 0) {
    return std::nullopt;
  }
  return std::string(buf.data(), static_cast<std::size_t>(N));
}

/**
 * @brief Last path component of a symlink target.
 *
 * Equivalent of `readlink <path> | xargs basename`, e.g. the driver name behind
 * /sys/class/drm/card0/device/driver.
 */
[[nodiscard]] inline std::optional<std::string> readLinkBasename(const std::string& path) noexcept {
  const std::optional<std::string> TARGET = readLink(path);
  if (!TARGET || TARGET->empty()) {
    return std::nullopt;
  }
  std::string_view view(*TARGET);
  while (view.size() > 1 && view.back() == '/') {
    view.remove_suffix(1);
  }
  const std::size_t SLASH = view.rfind('/');
  return std::string(SLASH == std::string_view::npos ? view : view.substr(SLASH + 1));
}

/* ----------------------------- Directories ----------------------------- */

/**
 * @brief List directory entry names (without "." and "..").
 * @return Names in readdir order; nullopt if the directory cannot be opened.
 */
[[nodiscard]] inline std::optional<std::vector<std::string>> readDirectory(const std::string& path) noexcept {
  DIR* dir = ::opendir(path.c_str());
  if (dir == nullptr) {
    return std::nullopt;
  }

  std::optional<std::vector<std::string>> out;
  try {
    out.emplace();
    while (const dirent* entry = ::readdir(dir)) {
      const std::string_view NAME(entry->d_name);
      if (NAME == "." || NAME == "..") {
        continue;
      }
      out->emplace_back(NAME);
    }
  } catch (const std::exception&) {
    out.reset();
  }

  ::closedir(dir);
  return out;
}

/**
 * @brief List directory entries, empty if the directory cannot be read.
 */
[[nodiscard]] inline std::vector<std::string> listDirectory(const std::string& path) noexcept {
  std::optional<std::vector<std::string>> entries = readDirectory(path);
  if (!entries) {
    return {};
  }
  return std::move(*entries);
}

/**
 * @brief Check if path exists (file, directory or device node).
 */
[[nodiscard]] inline bool pathExists(const std::string& path) noexcept {
  struct stat st{};
  return ::stat(path.c_str(), &st) == 0;
}

} // namespace files
} // namespace helpers
} // namespace rebind

#endif // REBIND_HELPERS_FILES_HPP
