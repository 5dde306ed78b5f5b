/**
 * @file ServiceManager.cpp
 * @brief systemctl-backed service manager.
 */

#include "src/system/inc/ServiceManager.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/system/inc/Command.hpp"

#include <exception> // std::exception
#include <regex>     // std::regex, std::regex_match

namespace rebind {

namespace system {

/* ----------------------------- Parsing ----------------------------- */

std::vector<std::string> parseUnitList(std::string_view output) {
  std::vector<std::string> units;
  for (const std::string& line : rebind::helpers::strings::splitLines(output)) {
    std::string_view view(line);
    // Some systemctl versions prefix failed units with a bullet marker.
    if (rebind::helpers::strings::startsWith(view, "\xE2\x97\x8F")) {
      view.remove_prefix(3);
    }
    view = rebind::helpers::strings::trim(view);
    const std::size_t END = view.find_first_of(" \t");
    const std::string_view NAME = view.substr(0, END);
    if (!NAME.empty()) {
      units.emplace_back(NAME);
    }
  }
  return units;
}

std::vector<std::string> filterUnits(const std::vector<std::string>& units,
                                     const std::string& pattern) noexcept {
  std::vector<std::string> out;
  try {
    const std::regex RE(pattern, std::regex::ECMAScript);
    for (const std::string& unit : units) {
      if (std::regex_match(unit, RE)) {
        out.push_back(unit);
      }
    }
  } catch (const std::exception&) {
    out.clear();
  }
  return out;
}

/* ----------------------------- SystemctlServiceManager ----------------------------- */

bool SystemctlServiceManager::isActive(const std::string& id) {
  return runCommand({"systemctl", "is-active", "--quiet", id}, OutputMode::Discard).ok();
}

bool SystemctlServiceManager::stop(const std::string& id) {
  return runCommand({"systemctl", "stop", id}, OutputMode::Inherit).ok();
}

bool SystemctlServiceManager::start(const std::string& id) {
  return runCommand({"systemctl", "start", id}, OutputMode::Inherit).ok();
}

std::vector<std::string> SystemctlServiceManager::listRunning(const std::string& pattern) {
  const CommandResult RES = runCommand({"systemctl", "list-units", "--type=service",
                                        "--state=running", "--no-legend", "--plain"});
  if (!RES.ok()) {
    return {};
  }
  return filterUnits(parseUnitList(RES.output), pattern);
}

} // namespace system

} // namespace rebind
