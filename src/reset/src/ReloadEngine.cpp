/**
 * @file ReloadEngine.cpp
 * @brief Kernel module release/reacquire state machine.
 */

#include "src/reset/inc/ReloadEngine.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <cstddef> // std::size_t
#include <thread>  // std::this_thread::sleep_for
#include <utility> // std::move

namespace rebind {

namespace reset {

const char* toString(BindingState state) noexcept {
  switch (state) {
  case BindingState::Bound:
    return "Bound";
  case BindingState::Unloading:
    return "Unloading";
  case BindingState::Unloaded:
    return "Unloaded";
  case BindingState::Reloading:
    return "Reloading";
  case BindingState::Failed:
    return "Failed";
  }
  return "Unknown";
}

ReloadEngine::ReloadEngine(system::ModuleBinder& binder, helpers::log::Logger& log,
                           ReloadOptions options, SleepFn sleep, InterruptCheck interrupted)
    : binder_(binder), log_(log), options_(std::move(options)), sleep_(std::move(sleep)),
      interrupted_(std::move(interrupted)) {
  if (!sleep_) {
    sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
  if (!interrupted_) {
    interrupted_ = [] { return false; };
  }
}

void ReloadEngine::enter(BindingState next, ReloadResult& result) {
  log_.debug("binding state {} -> {}", toString(state_), toString(next));
  state_ = next;
  result.states.push_back(next);
}

bool ReloadEngine::releaseWithRetry(const std::string& unit, ReloadResult& result) {
  log_.info("Unloading {}...", unit);
  if (binder_.unbind(unit)) {
    return true;
  }
  log_.warn("Failed to unload {}: {}. Retrying in {} ms...", unit, binder_.lastError(),
            options_.retryDelay.count());
  sleep_(options_.retryDelay);
  if (binder_.unbind(unit)) {
    return true;
  }
  const std::string DETAIL = binder_.lastError();
  log_.error("Failed to unload {}: {}", unit, DETAIL);
  result.faults.push_back({FaultKind::ReleaseFailure, unit, DETAIL});
  result.failedUnit = unit;
  return false;
}

void ReloadEngine::rollback(ReloadResult& result) {
  const std::vector<std::string>& RELEASED = result.released.units();
  if (RELEASED.empty()) {
    log_.info("Nothing was unloaded, no rollback needed");
  } else {
    log_.info("Rolling back {} unloaded module(s): {}", RELEASED.size(),
              helpers::strings::join(RELEASED, ", "));
  }

  bool intact = true;
  for (auto it = RELEASED.rbegin(); it != RELEASED.rend(); ++it) {
    log_.info("Reloading {}...", *it);
    if (binder_.bind(*it)) {
      result.reloaded.push_back(*it);
      continue;
    }
    const std::string DETAIL = binder_.lastError();
    log_.error("Rollback of {} failed: {}", *it, DETAIL);
    result.faults.push_back({FaultKind::ReacquireFailure, *it, DETAIL});
    intact = false;
  }

  result.bindingIntact = intact;
  enter(intact ? BindingState::Bound : BindingState::Failed, result);
}

void ReloadEngine::reload(ReloadResult& result) {
  enter(BindingState::Reloading, result);
  const std::vector<std::string>& ORDER = options_.unloadOrder;
  for (auto it = ORDER.rbegin(); it != ORDER.rend(); ++it) {
    log_.info("Loading {}...", *it);
    if (binder_.bind(*it)) {
      result.reloaded.push_back(*it);
      continue;
    }
    const std::string DETAIL = binder_.lastError();
    log_.error("Failed to load {}: {}", *it, DETAIL);
    result.faults.push_back({FaultKind::ReacquireFailure, *it, DETAIL});
    result.failedUnit = *it;
    result.outcome = RunOutcome::ReloadFailure;
    result.bindingIntact = false;
    enter(BindingState::Failed, result);
    return;
  }
  result.outcome = RunOutcome::Success;
  result.bindingIntact = true;
  enter(BindingState::Bound, result);
}

ReloadResult ReloadEngine::run() {
  ReloadResult result;
  state_ = BindingState::Bound;
  result.states.push_back(state_);

  const std::vector<std::string>& ORDER = options_.unloadOrder;
  std::vector<bool> loadedAtStart(ORDER.size(), false);
  for (std::size_t i = 0; i < ORDER.size(); ++i) {
    loadedAtStart[i] = binder_.isBound(ORDER[i]);
  }

  enter(BindingState::Unloading, result);
  for (std::size_t i = 0; i < ORDER.size(); ++i) {
    const std::string& unit = ORDER[i];
    if (interrupted_()) {
      log_.warn("Interrupted during unload, rolling back");
      rollback(result);
      result.outcome = RunOutcome::Aborted;
      return result;
    }
    if (!binder_.isBound(unit)) {
      // A dependency released by an earlier unit still belongs to this run.
      if (loadedAtStart[i]) {
        log_.info("{} was unloaded along with an earlier module", unit);
        result.released.append(unit);
      } else {
        log_.info("{} not loaded, skipping", unit);
      }
      continue;
    }
    if (!releaseWithRetry(unit, result)) {
      rollback(result);
      result.outcome = RunOutcome::PartialUnloadFailure;
      return result;
    }
    result.released.append(unit);
  }
  enter(BindingState::Unloaded, result);
  log_.info("All modules unloaded");

  reload(result);
  return result;
}

} // namespace reset

} // namespace rebind
