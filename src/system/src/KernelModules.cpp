/**
 * @file KernelModules.cpp
 * @brief /proc/modules parsing and modprobe-backed module binder.
 */

#include "src/system/inc/KernelModules.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/system/inc/Command.hpp"

#include <exception> // std::exception
#include <optional>  // std::optional
#include <utility> // std::move

#include <fmt/core.h>

namespace rebind {

namespace system {

namespace {

using rebind::helpers::strings::parseInt;
using rebind::helpers::strings::split;

/// Pop the next whitespace-delimited token from a line.
std::string_view nextToken(std::string_view& line) noexcept {
  std::size_t start = 0;
  while (start < line.size() && (line[start] == ' ' || line[start] == '\t')) {
    ++start;
  }
  std::size_t end = start;
  while (end < line.size() && line[end] != ' ' && line[end] != '\t') {
    ++end;
  }
  const std::string_view TOKEN = line.substr(start, end - start);
  line.remove_prefix(end);
  return TOKEN;
}

/// Parse one /proc/modules line. Returns false if required fields are missing.
bool parseModuleLine(std::string_view line, LoadedModule& mod) {
  const std::string_view NAME = nextToken(line);
  const std::string_view SIZE = nextToken(line);
  const std::string_view USES = nextToken(line);
  const std::string_view HOLDERS = nextToken(line);
  const std::string_view STATE = nextToken(line);

  if (NAME.empty() || SIZE.empty() || USES.empty()) {
    return false;
  }

  const auto SIZE_VAL = parseInt(SIZE);
  const auto USES_VAL = parseInt(USES);
  if (!SIZE_VAL || !USES_VAL) {
    return false;
  }

  mod.name = std::string(NAME);
  mod.sizeBytes = static_cast<std::size_t>(*SIZE_VAL);
  mod.useCount = static_cast<std::int32_t>(*USES_VAL);
  if (HOLDERS != "-") {
    mod.holders = split(HOLDERS, ',');
  }
  mod.state = std::string(STATE);
  return true;
}

} // namespace

/* ----------------------------- LoadedModule ----------------------------- */

std::string LoadedModule::toString() const {
  std::string out = fmt::format("{:<20} refs={:<4} state={}", name, useCount, state);
  if (!holders.empty()) {
    out += " holders=[";
    for (std::size_t i = 0; i < holders.size(); ++i) {
      if (i > 0) {
        out += ",";
      }
      out += holders[i];
    }
    out += "]";
  }
  return out;
}

/* ----------------------------- Inventory API ----------------------------- */

std::vector<LoadedModule> parseProcModules(std::string_view text) {
  std::vector<LoadedModule> out;
  for (const std::string& line : rebind::helpers::strings::splitLines(text)) {
    LoadedModule mod{};
    if (parseModuleLine(line, mod)) {
      out.push_back(std::move(mod));
    }
  }
  return out;
}

std::vector<LoadedModule> getLoadedModules(const std::string& path) noexcept {
  const std::optional<std::string> TEXT = rebind::helpers::files::readFile(path);
  if (!TEXT) {
    return {};
  }
  try {
    return parseProcModules(*TEXT);
  } catch (const std::exception&) {
    return {};
  }
}

std::string normalizeModuleName(std::string_view name) {
  std::string out(name);
  for (char& c : out) {
    if (c == '-') {
      c = '_';
    }
  }
  return out;
}

/* ----------------------------- ModprobeBinder ----------------------------- */

bool ModprobeBinder::unbind(const std::string& unit) {
  const CommandResult RES = runCommand({"modprobe", "-r", unit});
  if (!RES.ok()) {
    lastError_ = RES.summary();
    return false;
  }
  lastError_.clear();
  return true;
}

bool ModprobeBinder::bind(const std::string& unit) {
  const CommandResult RES = runCommand({"modprobe", unit});
  if (!RES.ok()) {
    lastError_ = RES.summary();
    return false;
  }
  lastError_.clear();
  return true;
}

bool ModprobeBinder::isBound(const std::string& unit) {
  const std::string WANTED = normalizeModuleName(unit);
  for (const LoadedModule& mod : getLoadedModules(procModulesPath_)) {
    if (mod.name == WANTED) {
      return true;
    }
  }
  return false;
}

} // namespace system

} // namespace rebind
