#ifndef REBIND_RESET_UTST_RESET_FAKES_HPP
#define REBIND_RESET_UTST_RESET_FAKES_HPP
/**
 * @file ResetFakes.hpp
 * @brief In-memory stand-ins for the reset collaborators.
 *
 * Every side effect is appended to a shared event list ("stop:gdm.service",
 * "unbind:nvidia_drm", "kill:1234", ...) so tests can assert on ordering
 * across collaborators.
 */

#include "src/gpu/inc/GpuManagement.hpp"
#include "src/system/inc/DetachedLauncher.hpp"
#include "src/system/inc/KernelModules.hpp"
#include "src/system/inc/ProcessTable.hpp"
#include "src/system/inc/ServiceManager.hpp"

#include <sys/types.h>

#include <algorithm>
#include <map>
#include <optional>
#include <regex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace rebind {

namespace reset {

namespace test {

using Events = std::vector<std::string>;

/// Position of an event in the log; events.size() if absent.
inline std::size_t indexOf(const Events& events, const std::string& event) {
  return static_cast<std::size_t>(std::find(events.begin(), events.end(), event) - events.begin());
}

/// Events that start with a prefix, in order.
inline Events withPrefix(const Events& events, const std::string& prefix) {
  Events out;
  for (const std::string& e : events) {
    if (e.rfind(prefix, 0) == 0) {
      out.push_back(e);
    }
  }
  return out;
}

/* ----------------------------- Services ----------------------------- */

class FakeServiceManager final : public system::ServiceManager {
public:
  explicit FakeServiceManager(Events& events) : events_(events) {}

  std::set<std::string> active;
  std::set<std::string> failStop;
  std::set<std::string> failStart;

  bool isActive(const std::string& id) override { return active.count(id) != 0; }

  bool stop(const std::string& id) override {
    if (failStop.count(id) != 0) {
      events_.push_back("stop-failed:" + id);
      return false;
    }
    events_.push_back("stop:" + id);
    active.erase(id);
    return true;
  }

  bool start(const std::string& id) override {
    if (failStart.count(id) != 0) {
      events_.push_back("start-failed:" + id);
      return false;
    }
    events_.push_back("start:" + id);
    active.insert(id);
    return true;
  }

  std::vector<std::string> listRunning(const std::string& pattern) override {
    return system::filterUnits(std::vector<std::string>(active.begin(), active.end()), pattern);
  }

private:
  Events& events_;
};

/* ----------------------------- Modules ----------------------------- */

class FakeModuleBinder final : public system::ModuleBinder {
public:
  explicit FakeModuleBinder(Events& events) : events_(events) {}

  std::set<std::string> bound{"nvidia", "nvidia_modeset", "nvidia_drm", "nvidia_uvm"};
  std::map<std::string, int> unbindFailures; ///< Remaining failed attempts per unit
  std::set<std::string> failBind;
  std::map<std::string, std::string> cascade; ///< Unit also released when the key is unbound
  std::set<std::string> throwOnUnbind;

  bool unbind(const std::string& unit) override {
    if (throwOnUnbind.count(unit) != 0) {
      events_.push_back("unbind-threw:" + unit);
      throw std::runtime_error("binder lost: " + unit);
    }
    auto it = unbindFailures.find(unit);
    if (it != unbindFailures.end() && it->second > 0) {
      --it->second;
      events_.push_back("unbind-failed:" + unit);
      error_ = "Module " + unit + " is in use";
      return false;
    }
    events_.push_back("unbind:" + unit);
    bound.erase(unit);
    const auto DEP = cascade.find(unit);
    if (DEP != cascade.end()) {
      bound.erase(DEP->second);
    }
    return true;
  }

  bool bind(const std::string& unit) override {
    if (failBind.count(unit) != 0) {
      events_.push_back("bind-failed:" + unit);
      error_ = "could not insert '" + unit + "'";
      return false;
    }
    events_.push_back("bind:" + unit);
    bound.insert(unit);
    return true;
  }

  bool isBound(const std::string& unit) override { return bound.count(unit) != 0; }

  std::string lastError() const override { return error_; }

private:
  Events& events_;
  std::string error_;
};

/* ----------------------------- Processes ----------------------------- */

class FakeProcessTable final : public system::ProcessTable {
public:
  explicit FakeProcessTable(Events& events) : events_(events) {}

  std::map<pid_t, std::string> names;                ///< comm; absent = unreadable
  std::map<pid_t, std::string> cmdlines;
  std::map<std::string, std::vector<pid_t>> openers; ///< node -> pids holding it
  std::set<pid_t> failKill;
  std::set<pid_t> killed;
  bool failHolders{false}; ///< holders() reports an unreadable process list

  std::optional<std::string> commandName(pid_t pid) override {
    const auto IT = names.find(pid);
    if (IT == names.end()) {
      return std::nullopt;
    }
    return IT->second;
  }

  std::optional<std::string> commandLine(pid_t pid) override {
    const auto IT = cmdlines.find(pid);
    if (IT == cmdlines.end()) {
      return std::nullopt;
    }
    return IT->second;
  }

  std::optional<std::vector<pid_t>> holders(const std::string& path) override {
    if (failHolders) {
      return std::nullopt;
    }
    std::vector<pid_t> out;
    const auto IT = openers.find(path);
    if (IT == openers.end()) {
      return out;
    }
    for (const pid_t PID : IT->second) {
      if (killed.count(PID) == 0) {
        out.push_back(PID);
      }
    }
    return out;
  }

  std::vector<pid_t> matchCommandLine(const std::string& pattern) override {
    std::vector<pid_t> out;
    const std::regex RE(pattern);
    for (const auto& [pid, cmd] : cmdlines) {
      if (killed.count(pid) == 0 && std::regex_search(cmd, RE)) {
        out.push_back(pid);
      }
    }
    return out;
  }

  bool kill(pid_t pid) override {
    if (failKill.count(pid) != 0) {
      events_.push_back("kill-failed:" + std::to_string(pid));
      return false;
    }
    events_.push_back("kill:" + std::to_string(pid));
    killed.insert(pid);
    return true;
  }

private:
  Events& events_;
};

/* ----------------------------- GPU management ----------------------------- */

class FakeGpuManagement final : public gpu::GpuManagement {
public:
  explicit FakeGpuManagement(Events& events) : events_(events) {}

  std::optional<std::vector<gpu::GpuProcess>> processes{std::vector<gpu::GpuProcess>{}};
  bool persistenceOk{true};
  std::optional<gpu::GpuLiveStatus> status;

  const char* name() const noexcept override { return "fake"; }

  std::optional<std::vector<gpu::GpuProcess>> computeProcesses(const gpu::GpuTarget&) override {
    return processes;
  }

  std::optional<std::vector<gpu::GpuProcess>> allComputeProcesses() override { return processes; }

  std::optional<gpu::GpuLiveStatus> liveStatus(const gpu::GpuTarget&) override { return status; }

  std::optional<std::vector<gpu::GpuLiveStatus>> allLiveStatus() override {
    if (!status) {
      return std::nullopt;
    }
    return std::vector<gpu::GpuLiveStatus>{*status};
  }

  bool disablePersistence(const gpu::GpuTarget&) override {
    events_.push_back("persistence-off");
    return persistenceOk;
  }

private:
  Events& events_;
};

/* ----------------------------- Launcher ----------------------------- */

class FakeLauncher final : public system::DetachedLauncher {
public:
  explicit FakeLauncher(Events& events) : events_(events) {}

  bool detached{false};
  bool launchOk{true};
  int childExit{0};
  std::vector<system::LaunchRequest> requests;

  bool isDetached() const override { return detached; }

  system::LaunchHandle runDetached(const system::LaunchRequest& request) override {
    events_.push_back("launch:" + request.unitName);
    requests.push_back(request);
    system::LaunchHandle handle;
    handle.unitName = request.unitName;
    handle.launched = launchOk;
    handle.exitCode = launchOk ? childExit : -1;
    if (!launchOk) {
      handle.detail = "systemd-run not found";
    }
    return handle;
  }

private:
  Events& events_;
};

} // namespace test

} // namespace reset

} // namespace rebind

#endif // REBIND_RESET_UTST_RESET_FAKES_HPP
