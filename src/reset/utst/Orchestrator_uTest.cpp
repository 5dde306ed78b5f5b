/**
 * @file Orchestrator_uTest.cpp
 * @brief End-to-end reset runs against in-memory collaborators.
 */

#include "src/reset/inc/Interrupt.hpp"
#include "src/reset/inc/Orchestrator.hpp"
#include "src/reset/utst/ResetFakes.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using rebind::gpu::DeviceSurface;
using rebind::gpu::GpuLiveStatus;
using rebind::gpu::GpuProcess;
using rebind::gpu::GpuTarget;
using rebind::helpers::log::Level;
using rebind::helpers::log::Logger;
using rebind::helpers::log::MemorySink;
using rebind::reset::ConsumerClass;
using rebind::reset::EscapeDecision;
using rebind::reset::FaultKind;
using rebind::reset::GpuResetOrchestrator;
using rebind::reset::InterruptScope;
using rebind::reset::ResetConfig;
using rebind::reset::ResetDependencies;
using rebind::reset::RunOutcome;
using rebind::reset::RunReport;
using rebind::reset::test::Events;
using rebind::reset::test::FakeGpuManagement;
using rebind::reset::test::FakeLauncher;
using rebind::reset::test::FakeModuleBinder;
using rebind::reset::test::FakeProcessTable;
using rebind::reset::test::FakeServiceManager;
using rebind::reset::test::indexOf;
using rebind::reset::test::withPrefix;

namespace {

constexpr const char* CARD = "/dev/dri/card1";
constexpr const char* NODE = "/dev/nvidia0";
constexpr const char* DM = "gdm.service";
constexpr pid_t XORG_PID = 900;
constexpr pid_t COMPUTE_PID = 1234;

/// Strip an "op:" prefix from each event.
std::vector<std::string> subjects(const Events& events) {
  std::vector<std::string> out;
  for (const std::string& e : events) {
    out.push_back(e.substr(e.find(':') + 1));
  }
  return out;
}

} // namespace

/* ----------------------------- Fixture ----------------------------- */

class OrchestratorTest : public ::testing::Test {
protected:
  Events events_;
  FakeGpuManagement gpu_{events_};
  FakeProcessTable procs_{events_};
  FakeServiceManager services_{events_};
  FakeModuleBinder binder_{events_};
  FakeLauncher launcher_{events_};
  Logger log_;
  std::shared_ptr<MemorySink> mem_ = std::make_shared<MemorySink>();
  std::vector<std::chrono::milliseconds> sleeps_;
  bool interrupt_{false};
  bool interruptOnPreUnload_{false};
  bool throwOnPreUnload_{false};

  ResetConfig config_;
  GpuTarget target_{0, "0000:65:00.0", 0};

  void SetUp() override {
    log_.addSink(mem_);
    log_.setLevel(Level::Debug);
    config_.runId = "1700000000";
    config_.managedServices = {"nvidia-persistenced", "dcgm"};
    config_.unloadOrder = {"u1", "u2", "u3", "u4"};
    config_.retryDelay = std::chrono::milliseconds(5);
    binder_.bound = {"u1", "u2", "u3", "u4"};
    services_.active = {"nvidia-persistenced"};
  }

  /// Xorg on the driver's DRM card, its display manager running.
  void addDisplayServer() {
    procs_.names[XORG_PID] = "Xorg";
    procs_.openers[CARD] = {XORG_PID};
    services_.active.insert(DM);
  }

  /// python3 reported by the management interface and holding the compute node.
  void addComputeConsumer() {
    GpuProcess p;
    p.pid = COMPUTE_PID;
    p.pciBdf = target_.pciBdf;
    gpu_.processes = std::vector<GpuProcess>{p};
    procs_.names[COMPUTE_PID] = "python3";
    procs_.openers[NODE] = {COMPUTE_PID};
  }

  RunReport run() {
    ResetDependencies deps{
        gpu_,
        procs_,
        services_,
        binder_,
        launcher_,
        log_,
        [](const GpuTarget&) { return DeviceSurface{{CARD}, {NODE}}; },
        [this] { return interrupt_; },
        [this](std::chrono::milliseconds d) {
          sleeps_.push_back(d);
          if (interruptOnPreUnload_ && d == config_.preUnloadDelay) {
            interrupt_ = true;
          }
          if (throwOnPreUnload_ && d == config_.preUnloadDelay) {
            throw std::runtime_error("collaborator failure");
          }
        },
    };
    GpuResetOrchestrator orchestrator(config_, deps);
    return orchestrator.run(target_, {"/usr/local/bin/gpu-reset", "--device", "0"});
  }
};

/* ----------------------------- Scenarios ----------------------------- */

/** @test Idle GPU: daemons stopped, modules cycled, daemons restored. */
TEST_F(OrchestratorTest, IdleGpuSucceeds) {
  gpu_.status = GpuLiveStatus{0, target_.pciBdf, 35.12, 3U, 30U, 8};
  const RunReport R = run();

  EXPECT_EQ(R.outcome, RunOutcome::Success);
  EXPECT_EQ(R.exitCode, 0);
  EXPECT_EQ(R.escape, EscapeDecision::NotNeeded);
  EXPECT_TRUE(R.consumers.empty());
  EXPECT_TRUE(launcher_.requests.empty());
  EXPECT_EQ(subjects(withPrefix(events_, "unbind:")),
            (std::vector<std::string>{"u1", "u2", "u3", "u4"}));
  EXPECT_EQ(subjects(withPrefix(events_, "bind:")),
            (std::vector<std::string>{"u4", "u3", "u2", "u1"}));
  EXPECT_EQ(R.stoppedServices, (std::vector<std::string>{"nvidia-persistenced"}));
  EXPECT_EQ(R.restoration.restarted, (std::vector<std::string>{"nvidia-persistenced"}));
  EXPECT_LT(indexOf(events_, "bind:u1"), indexOf(events_, "start:nvidia-persistenced"));
  EXPECT_TRUE(mem_->contains(Level::Info, "GPU reset complete"));
  EXPECT_TRUE(mem_->contains(Level::Info, "GPU status: 0, 35.12 W, 3 %, 30 %, P8"));
}

/** @test A compute consumer is killed before any module is released. */
TEST_F(OrchestratorTest, ComputeConsumerKilled) {
  addComputeConsumer();
  const RunReport R = run();

  EXPECT_EQ(R.outcome, RunOutcome::Success);
  EXPECT_EQ(R.killed, (std::vector<pid_t>{COMPUTE_PID}));
  ASSERT_EQ(R.consumers.size(), 1U);
  EXPECT_EQ(R.consumers[0].classification, ConsumerClass::Compute);
  EXPECT_LT(indexOf(events_, "kill:1234"), indexOf(events_, "unbind:u1"));
  EXPECT_LT(indexOf(events_, "stop:nvidia-persistenced"), indexOf(events_, "kill:1234"));
}

/** @test Watchers are killed alongside consumers. */
TEST_F(OrchestratorTest, WatcherKilled) {
  procs_.names[400] = "watch";
  procs_.cmdlines[400] = "watch -n 1 nvidia-smi";
  const RunReport R = run();
  EXPECT_EQ(R.killed, (std::vector<pid_t>{400}));
  EXPECT_LT(indexOf(events_, "kill:400"), indexOf(events_, "unbind:u1"));
}

/** @test A display server inside the session forces a detached relaunch before any stop. */
TEST_F(OrchestratorTest, DisplayServerRelaunches) {
  addDisplayServer();
  launcher_.childExit = 0;
  const RunReport R = run();

  EXPECT_EQ(R.escape, EscapeDecision::Relaunched);
  EXPECT_TRUE(R.relaunched);
  EXPECT_EQ(R.displayService.value_or(""), DM);
  EXPECT_EQ(R.outcome, RunOutcome::Success);
  EXPECT_EQ(events_, (Events{"launch:gpu-reset-1700000000"}));

  ASSERT_EQ(launcher_.requests.size(), 1U);
  const auto& ENV = launcher_.requests[0].env;
  EXPECT_NE(std::find(ENV.begin(), ENV.end(), std::make_pair(std::string("DM"), std::string(DM))),
            ENV.end());
  EXPECT_NE(std::find(ENV.begin(), ENV.end(),
                      std::make_pair(std::string("GPU_RESET_TARGET"), target_.pciBdf)),
            ENV.end());
  EXPECT_EQ(launcher_.requests[0].command.front(), "/usr/local/bin/gpu-reset");
}

/** @test The detached run's exit status becomes ours. */
TEST_F(OrchestratorTest, RelaunchPropagatesExitCode) {
  addDisplayServer();
  launcher_.childExit = 2;
  const RunReport R = run();
  EXPECT_EQ(R.exitCode, 2);
  EXPECT_EQ(R.outcome, RunOutcome::ReloadFailure);
}

/** @test A failed launch aborts with nothing stopped. */
TEST_F(OrchestratorTest, LaunchFailureAborts) {
  addDisplayServer();
  launcher_.launchOk = false;
  const RunReport R = run();
  EXPECT_EQ(R.outcome, RunOutcome::Aborted);
  EXPECT_EQ(R.exitCode, 3);
  EXPECT_TRUE(withPrefix(events_, "stop:").empty());
  EXPECT_TRUE(withPrefix(events_, "unbind:").empty());
  EXPECT_TRUE(withPrefix(events_, "kill:").empty());
}

/** @test Detached: the display manager stops after the daemons and restarts first. */
TEST_F(OrchestratorTest, DetachedStopsDisplayManager) {
  addDisplayServer();
  addComputeConsumer();
  launcher_.detached = true;
  const RunReport R = run();

  EXPECT_EQ(R.outcome, RunOutcome::Success);
  EXPECT_EQ(R.escape, EscapeDecision::AlreadyDetached);
  EXPECT_EQ(R.stoppedServices, (std::vector<std::string>{"nvidia-persistenced", DM}));
  EXPECT_EQ(indexOf(events_, "kill:900"), events_.size());
  EXPECT_LT(indexOf(events_, "stop:gdm.service"), indexOf(events_, "unbind:u1"));
  EXPECT_EQ(subjects(withPrefix(events_, "start:")),
            (std::vector<std::string>{DM, "nvidia-persistenced"}));
  EXPECT_NE(std::find(sleeps_.begin(), sleeps_.end(), config_.displaySettleDelay), sleeps_.end());
}

/** @test A forwarded display manager is used without re-detecting. */
TEST_F(OrchestratorTest, ForwardedDisplayService) {
  services_.active.insert("sddm.service");
  config_.forwardedDisplayService = "sddm.service";
  launcher_.detached = true;
  const RunReport R = run();
  EXPECT_EQ(R.displayService.value_or(""), "sddm.service");
  EXPECT_NE(indexOf(events_, "stop:sddm.service"), events_.size());
  EXPECT_NE(indexOf(events_, "start:sddm.service"), events_.size());
}

/** @test A stuck module rolls back what was released and restores everything. */
TEST_F(OrchestratorTest, PartialUnloadRollsBack) {
  addDisplayServer();
  launcher_.detached = true;
  binder_.unbindFailures["u2"] = 2;
  const RunReport R = run();

  EXPECT_EQ(R.outcome, RunOutcome::PartialUnloadFailure);
  EXPECT_EQ(R.exitCode, 1);
  EXPECT_EQ(subjects(withPrefix(events_, "bind:")), (std::vector<std::string>{"u1"}));
  EXPECT_TRUE(R.reload.bindingIntact);
  EXPECT_EQ(R.restoration.restarted, (std::vector<std::string>{DM, "nvidia-persistenced"}));
  EXPECT_TRUE(R.restoration.withheld.empty());
  EXPECT_LT(indexOf(events_, "bind:u1"), indexOf(events_, "start:gdm.service"));
}

/** @test A failed reload withholds the display manager and tells the operator. */
TEST_F(OrchestratorTest, ReloadFailureWithholdsDisplayManager) {
  addDisplayServer();
  launcher_.detached = true;
  binder_.failBind = {"u3"};
  const RunReport R = run();

  EXPECT_EQ(R.outcome, RunOutcome::ReloadFailure);
  EXPECT_EQ(R.exitCode, 2);
  EXPECT_FALSE(R.reload.bindingIntact);
  EXPECT_EQ(R.restoration.withheld, (std::vector<std::string>{DM}));
  EXPECT_EQ(indexOf(events_, "start:gdm.service"), events_.size());
  EXPECT_NE(indexOf(events_, "start:nvidia-persistenced"), events_.size());
  EXPECT_TRUE(mem_->contains(Level::Warn, "skipping gdm.service restart to avoid login loop"));
  EXPECT_TRUE(mem_->contains(Level::Warn, "modprobe u4 && systemctl start gdm.service"));
  EXPECT_FALSE(mem_->contains("GPU reset complete"));
}

/* ----------------------------- Properties ----------------------------- */

/** @test Restore order is the reverse of stop order. */
TEST_F(OrchestratorTest, RestoreReversesStop) {
  addDisplayServer();
  launcher_.detached = true;
  services_.active.insert("dcgm");
  const RunReport R = run();

  std::vector<std::string> stopped = subjects(withPrefix(events_, "stop:"));
  const std::vector<std::string> STARTED = subjects(withPrefix(events_, "start:"));
  std::reverse(stopped.begin(), stopped.end());
  EXPECT_EQ(STARTED, stopped);
  EXPECT_EQ(R.stoppedServices.size(), 3U);
}

/** @test Services already down are neither stopped nor started. */
TEST_F(OrchestratorTest, InactiveServicesUntouched) {
  services_.active.clear();
  const RunReport R = run();
  EXPECT_TRUE(withPrefix(events_, "stop:").empty());
  EXPECT_TRUE(withPrefix(events_, "start:").empty());
  EXPECT_EQ(R.outcome, RunOutcome::Success);
}

/** @test A daemon that will not stop is recorded and the run continues. */
TEST_F(OrchestratorTest, StopFailureAbsorbed) {
  services_.active.insert("dcgm");
  services_.failStop = {"dcgm"};
  const RunReport R = run();
  EXPECT_EQ(R.outcome, RunOutcome::Success);
  EXPECT_TRUE(std::any_of(R.faults.begin(), R.faults.end(), [](const auto& f) {
    return f.kind == FaultKind::StopFailure && f.subject == "dcgm";
  }));
  EXPECT_EQ(indexOf(events_, "start:dcgm"), events_.size());
}

/** @test Degraded detection is reported but does not fail the run. */
TEST_F(OrchestratorTest, DegradedDetection) {
  gpu_.processes = std::nullopt;
  const RunReport R = run();
  EXPECT_EQ(R.outcome, RunOutcome::Success);
  EXPECT_TRUE(std::any_of(R.faults.begin(), R.faults.end(), [](const auto& f) {
    return f.kind == FaultKind::DetectionDegraded;
  }));
}

/* ----------------------------- Interruption ----------------------------- */

/** @test An interrupt before any change exits Aborted with nothing touched. */
TEST_F(OrchestratorTest, InterruptBeforeStart) {
  interrupt_ = true;
  const RunReport R = run();
  EXPECT_EQ(R.outcome, RunOutcome::Aborted);
  EXPECT_EQ(R.exitCode, 3);
  EXPECT_TRUE(events_.empty());
}

/** @test An interrupt mid-run still restores what was stopped. */
TEST_F(OrchestratorTest, InterruptRestores) {
  interruptOnPreUnload_ = true;
  const RunReport R = run();
  EXPECT_EQ(R.outcome, RunOutcome::Aborted);
  EXPECT_EQ(R.exitCode, 3);
  EXPECT_TRUE(withPrefix(events_, "unbind:").empty());
  EXPECT_EQ(R.restoration.restarted, (std::vector<std::string>{"nvidia-persistenced"}));
}

/** @test The signal that stopped the run is logged. */
TEST_F(OrchestratorTest, InterruptLogsSignal) {
  InterruptScope::reset();
  InterruptScope::raiseFlag(SIGTERM);
  interrupt_ = true;
  const RunReport R = run();
  InterruptScope::reset();
  EXPECT_EQ(R.outcome, RunOutcome::Aborted);
  EXPECT_TRUE(mem_->contains(Level::Warn, "Interrupted by signal 15"));
}

/* ----------------------------- Exceptions ----------------------------- */

/** @test An exception before unload propagates after every stopped service is restarted. */
TEST_F(OrchestratorTest, ExceptionRestoresServices) {
  addDisplayServer();
  launcher_.detached = true;
  services_.active.insert("dcgm");
  throwOnPreUnload_ = true;
  EXPECT_THROW(run(), std::runtime_error);

  std::vector<std::string> stopped = subjects(withPrefix(events_, "stop:"));
  ASSERT_EQ(stopped, (std::vector<std::string>{"nvidia-persistenced", "dcgm", DM}));
  std::reverse(stopped.begin(), stopped.end());
  EXPECT_EQ(subjects(withPrefix(events_, "start:")), stopped);
  EXPECT_TRUE(withPrefix(events_, "unbind").empty());
}

/** @test An exception during unload restores the daemons but withholds the display manager. */
TEST_F(OrchestratorTest, ExceptionDuringUnloadWithholdsDisplayManager) {
  addDisplayServer();
  launcher_.detached = true;
  binder_.throwOnUnbind = {"u2"};
  EXPECT_THROW(run(), std::runtime_error);

  EXPECT_NE(indexOf(events_, "unbind:u1"), events_.size());
  EXPECT_NE(indexOf(events_, "unbind-threw:u2"), events_.size());
  EXPECT_EQ(subjects(withPrefix(events_, "start:")),
            (std::vector<std::string>{"nvidia-persistenced"}));
  EXPECT_EQ(indexOf(events_, "start:gdm.service"), events_.size());
  EXPECT_TRUE(mem_->contains(Level::Warn, "systemctl start gdm.service"));
}
