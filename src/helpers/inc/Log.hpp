#ifndef REBIND_HELPERS_LOG_HPP
#define REBIND_HELPERS_LOG_HPP
/**
 * @file Log.hpp
 * @brief Sequential, timestamped decision log with pluggable sinks.
 *
 * Every step of a reset run is written here: detected consumers, service
 * stop/start actions, module unload/reload attempts and the final status.
 * Formatting uses fmt; sinks receive fully formatted records.
 *
 * @note Not thread-safe. A reset run is single-threaded.
 * @note Logging never throws; formatting errors are reported in-band.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace rebind {
namespace helpers {
namespace log {

/* ----------------------------- Level ----------------------------- */

/**
 * @brief Log severity.
 */
enum class Level : std::uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/**
 * @brief Convert level to its fixed-width tag ("DEBUG", "INFO", ...).
 */
[[nodiscard]] const char* toString(Level level) noexcept;

/* ----------------------------- Record ----------------------------- */

/**
 * @brief One log entry.
 */
struct Record {
  std::chrono::system_clock::time_point time{}; ///< Wall-clock time of the entry
  Level level{Level::Info};                     ///< Severity
  std::string message;                          ///< Formatted body (no newline)
};

/**
 * @brief Render a record as "YYYY-mm-dd HH:MM:SS [LEVEL] message".
 */
[[nodiscard]] std::string formatRecord(const Record& record);

/* ----------------------------- Sinks ----------------------------- */

/**
 * @brief Destination for formatted records.
 */
class Sink {
public:
  virtual ~Sink() = default;
  virtual void write(const Record& record) noexcept = 0;
};

/**
 * @brief Writes records to a stdio stream (stdout by default).
 */
class ConsoleSink final : public Sink {
public:
  explicit ConsoleSink(std::FILE* stream = stdout) noexcept : stream_(stream) {}
  void write(const Record& record) noexcept override;

private:
  std::FILE* stream_;
};

/**
 * @brief Appends records to a log file; flushed after every line.
 */
class FileSink final : public Sink {
public:
  explicit FileSink(const std::string& path) noexcept;
  ~FileSink() override;

  FileSink(const FileSink&) = delete;
  FileSink& operator=(const FileSink&) = delete;

  /// True if the file was opened.
  [[nodiscard]] bool valid() const noexcept { return file_ != nullptr; }

  /// Path the sink was opened with.
  [[nodiscard]] const std::string& path() const noexcept { return path_; }

  void write(const Record& record) noexcept override;

private:
  std::string path_;
  std::FILE* file_{nullptr};
};

/**
 * @brief Keeps records in memory. Used by tests to assert on the decision log.
 */
class MemorySink final : public Sink {
public:
  void write(const Record& record) noexcept override;

  [[nodiscard]] const std::vector<Record>& records() const noexcept { return records_; }

  /// Number of records at the given level.
  [[nodiscard]] std::size_t count(Level level) const noexcept;

  /// True if any record at the given level contains the text.
  [[nodiscard]] bool contains(Level level, std::string_view text) const noexcept;

  /// True if any record contains the text.
  [[nodiscard]] bool contains(std::string_view text) const noexcept;

private:
  std::vector<Record> records_;
};

/* ----------------------------- Logger ----------------------------- */

/**
 * @brief Fan-out logger with a minimum level.
 */
class Logger {
public:
  Logger() = default;

  /// Attach a sink. Records are delivered in attachment order.
  void addSink(std::shared_ptr<Sink> sink);

  void setLevel(Level level) noexcept { level_ = level; }
  [[nodiscard]] Level level() const noexcept { return level_; }

  /// Deliver an already formatted message.
  void write(Level level, std::string message) noexcept;

  template <typename... Args> void debug(fmt::format_string<Args...> fmtStr, Args&&... args) noexcept {
    log(Level::Debug, fmtStr, std::forward<Args>(args)...);
  }
  template <typename... Args> void info(fmt::format_string<Args...> fmtStr, Args&&... args) noexcept {
    log(Level::Info, fmtStr, std::forward<Args>(args)...);
  }
  template <typename... Args> void warn(fmt::format_string<Args...> fmtStr, Args&&... args) noexcept {
    log(Level::Warn, fmtStr, std::forward<Args>(args)...);
  }
  template <typename... Args> void error(fmt::format_string<Args...> fmtStr, Args&&... args) noexcept {
    log(Level::Error, fmtStr, std::forward<Args>(args)...);
  }

private:
  template <typename... Args>
  void log(Level level, fmt::format_string<Args...> fmtStr, Args&&... args) noexcept {
    if (level < level_) {
      return;
    }
    try {
      write(level, fmt::format(fmtStr, std::forward<Args>(args)...));
    } catch (const std::exception&) {
      write(level, FORMAT_ERROR_TEXT);
    }
  }

  /// Fits the small-string buffer, so building it cannot allocate.
  static constexpr const char* FORMAT_ERROR_TEXT = "[format error]";

  std::vector<std::shared_ptr<Sink>> sinks_;
  Level level_{Level::Info};
};

} // namespace log
} // namespace helpers
} // namespace rebind

#endif // REBIND_HELPERS_LOG_HPP
