/**
 * @file SessionEscape_uTest.cpp
 * @brief Unit tests for leaving the login session.
 */

#include "src/reset/inc/SessionEscape.hpp"
#include "src/reset/utst/ResetFakes.hpp"

#include <gtest/gtest.h>

using rebind::helpers::log::Logger;
using rebind::reset::EscapeDecision;
using rebind::reset::EscapeResult;
using rebind::reset::SessionEscape;
using rebind::reset::test::Events;
using rebind::reset::test::FakeLauncher;
using rebind::system::LaunchRequest;

class SessionEscapeTest : public ::testing::Test {
protected:
  Events events_;
  FakeLauncher launcher_{events_};
  Logger log_;
  SessionEscape escape_{launcher_, log_};
  LaunchRequest request_{"gpu-reset-1700000000", {"/usr/bin/gpu-reset"}, {{"TS", "1700000000"}}};
};

/** @test No display-manager stop means no relaunch. */
TEST_F(SessionEscapeTest, NotNeeded) {
  const EscapeResult R = escape_.ensureDetached(false, request_);
  EXPECT_EQ(R.decision, EscapeDecision::NotNeeded);
  EXPECT_TRUE(events_.empty());
}

/** @test A run already inside a unit proceeds in place. */
TEST_F(SessionEscapeTest, AlreadyDetached) {
  launcher_.detached = true;
  const EscapeResult R = escape_.ensureDetached(true, request_);
  EXPECT_EQ(R.decision, EscapeDecision::AlreadyDetached);
  EXPECT_TRUE(launcher_.requests.empty());
}

/** @test The detached run's status is handed back. */
TEST_F(SessionEscapeTest, Relaunches) {
  launcher_.childExit = 2;
  const EscapeResult R = escape_.ensureDetached(true, request_);
  EXPECT_EQ(R.decision, EscapeDecision::Relaunched);
  EXPECT_EQ(R.exitCode, 2);
  ASSERT_EQ(launcher_.requests.size(), 1U);
  EXPECT_EQ(launcher_.requests[0].unitName, "gpu-reset-1700000000");
}

/** @test A launcher that cannot start reports LaunchFailed. */
TEST_F(SessionEscapeTest, LaunchFailed) {
  launcher_.launchOk = false;
  const EscapeResult R = escape_.ensureDetached(true, request_);
  EXPECT_EQ(R.decision, EscapeDecision::LaunchFailed);
  EXPECT_FALSE(R.detail.empty());
}
