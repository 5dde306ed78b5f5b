/**
 * @file Log.cpp
 * @brief Timestamped logger and its console/file/memory sinks.
 */

#include "src/helpers/inc/Log.hpp"

#include <ctime>     // std::time_t
#include <exception> // std::exception

#include <fmt/chrono.h>

namespace rebind {
namespace helpers {
namespace log {

/* ----------------------------- Level ----------------------------- */

const char* toString(Level level) noexcept {
  switch (level) {
  case Level::Debug:
    return "DEBUG";
  case Level::Info:
    return "INFO";
  case Level::Warn:
    return "WARN";
  case Level::Error:
    return "ERROR";
  default:
    return "UNKNOWN";
  }
}

/* ----------------------------- Record ----------------------------- */

std::string formatRecord(const Record& record) {
  const std::time_t SECS = std::chrono::system_clock::to_time_t(record.time);
  return fmt::format("{:%Y-%m-%d %H:%M:%S} [{}] {}", fmt::localtime(SECS), toString(record.level),
                     record.message);
}

/* ----------------------------- ConsoleSink ----------------------------- */

void ConsoleSink::write(const Record& record) noexcept {
  if (stream_ == nullptr) {
    return;
  }
  try {
    fmt::print(stream_, "{}\n", formatRecord(record));
    std::fflush(stream_);
  } catch (const std::exception&) {
    std::fputs("[log] console write failed\n", stderr);
  }
}

/* ----------------------------- FileSink ----------------------------- */

FileSink::FileSink(const std::string& path) noexcept : path_(path) {
  file_ = std::fopen(path.c_str(), "ae");
}

FileSink::~FileSink() {
  if (file_ != nullptr) {
    std::fclose(file_);
  }
}

void FileSink::write(const Record& record) noexcept {
  if (file_ == nullptr) {
    return;
  }
  try {
    fmt::print(file_, "{}\n", formatRecord(record));
    std::fflush(file_);
  } catch (const std::exception&) {
    std::fputs("[log] file write failed\n", stderr);
  }
}

/* ----------------------------- MemorySink ----------------------------- */

void MemorySink::write(const Record& record) noexcept {
  try {
    records_.push_back(record);
  } catch (const std::exception&) {
    std::fputs("[log] memory sink full\n", stderr);
  }
}

std::size_t MemorySink::count(Level level) const noexcept {
  std::size_t n = 0;
  for (const Record& rec : records_) {
    if (rec.level == level) {
      ++n;
    }
  }
  return n;
}

bool MemorySink::contains(Level level, std::string_view text) const noexcept {
  for (const Record& rec : records_) {
    if (rec.level == level && rec.message.find(text) != std::string::npos) {
      return true;
    }
  }
  return false;
}

bool MemorySink::contains(std::string_view text) const noexcept {
  for (const Record& rec : records_) {
    if (rec.message.find(text) != std::string::npos) {
      return true;
    }
  }
  return false;
}

/* ----------------------------- Logger ----------------------------- */

void Logger::addSink(std::shared_ptr<Sink> sink) {
  if (sink) {
    sinks_.push_back(std::move(sink));
  }
}

void Logger::write(Level level, std::string message) noexcept {
  if (level < level_) {
    return;
  }
  Record record;
  record.time = std::chrono::system_clock::now();
  record.level = level;
  record.message = std::move(message);
  for (const auto& sink : sinks_) {
    sink->write(record);
  }
}

} // namespace log
} // namespace helpers
} // namespace rebind
