/**
 * @file AlertDebouncer_uTest.cpp
 * @brief Unit tests for pulse::sampling::AlertDebouncer.
 *
 * Notes:
 *  - Time is driven explicitly from a fixed origin; no sleeping.
 */

#include "src/sampling/inc/AlertDebouncer.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

using pulse::sampling::AlertDebouncer;
using pulse::sampling::AlertEvent;
using pulse::sampling::AlertPhase;
using pulse::sampling::toString;

using namespace std::chrono_literals;

class AlertDebouncerTest : public ::testing::Test {
protected:
  using Clock = AlertDebouncer::Clock;

  AlertDebouncer deb_{60s};
  Clock::time_point t0_{Clock::time_point{} + 24h};

  /// Feed one tick, seconds after t0_.
  AlertEvent feed(bool breach, int second) { return deb_.update(breach, t0_ + std::chrono::seconds(second)); }
};

/* ----------------------------- Initial State ----------------------------- */

/** @test Fresh debouncer is idle with no notification time. */
TEST_F(AlertDebouncerTest, StartsIdle) {
  EXPECT_EQ(deb_.phase(), AlertPhase::IDLE);
  EXPECT_EQ(deb_.alertCount(), 0U);
  EXPECT_EQ(deb_.resolveCount(), 0U);
  EXPECT_FALSE(deb_.triggered());
  EXPECT_FALSE(deb_.lastNotifiedAt().has_value());
}

/* ----------------------------- Alert Path ----------------------------- */

/** @test Alert fires on exactly the third consecutive breach. */
TEST_F(AlertDebouncerTest, AlertOnThirdBreach) {
  EXPECT_EQ(feed(true, 1), AlertEvent::NONE);
  EXPECT_EQ(deb_.phase(), AlertPhase::ALERT_RISING);
  EXPECT_EQ(feed(true, 2), AlertEvent::NONE);
  EXPECT_EQ(deb_.alertCount(), 2U);
  EXPECT_EQ(feed(true, 3), AlertEvent::ALERT);

  EXPECT_TRUE(deb_.triggered());
  EXPECT_EQ(deb_.phase(), AlertPhase::TRIGGERED);
  ASSERT_TRUE(deb_.lastNotifiedAt().has_value());
  EXPECT_EQ(*deb_.lastNotifiedAt(), t0_ + 3s);
}

/** @test Two breaches then one clear tick resets the breach count. */
TEST_F(AlertDebouncerTest, InterruptedBreachResets) {
  EXPECT_EQ(feed(true, 1), AlertEvent::NONE);
  EXPECT_EQ(feed(true, 2), AlertEvent::NONE);
  EXPECT_EQ(feed(false, 3), AlertEvent::NONE);
  EXPECT_EQ(deb_.alertCount(), 0U);
  EXPECT_EQ(deb_.resolveCount(), 1U);

  EXPECT_EQ(feed(true, 4), AlertEvent::NONE);
  EXPECT_EQ(feed(true, 5), AlertEvent::NONE);
  EXPECT_FALSE(deb_.triggered());
}

/** @test Counters saturate at three and stay mutually exclusive. */
TEST_F(AlertDebouncerTest, CountersSaturateAndExclude) {
  for (int s = 1; s <= 10; ++s) {
    (void)feed(true, s);
    EXPECT_LE(deb_.alertCount(), 3U);
    EXPECT_EQ(deb_.resolveCount(), 0U);
  }
  for (int s = 11; s <= 20; ++s) {
    (void)feed(false, s);
    EXPECT_LE(deb_.resolveCount(), 3U);
    EXPECT_EQ(deb_.alertCount(), 0U);
  }
}

/** @test Sustained breach is silent inside the cooldown and repeats after it. */
TEST_F(AlertDebouncerTest, SustainedBreachRepeatsAfterCooldown) {
  (void)feed(true, 1);
  (void)feed(true, 2);
  ASSERT_EQ(feed(true, 3), AlertEvent::ALERT);

  for (int s = 4; s <= 63; ++s) {
    EXPECT_EQ(feed(true, s), AlertEvent::NONE) << "second " << s;
  }
  EXPECT_EQ(feed(true, 64), AlertEvent::ALERT);
}

/** @test First alert is held back while the cooldown since the last notice runs. */
TEST_F(AlertDebouncerTest, AlertWaitsForCooldown) {
  (void)feed(true, 1);
  (void)feed(true, 2);
  ASSERT_EQ(feed(true, 3), AlertEvent::ALERT);
  for (int s = 4; s <= 6; ++s) {
    (void)feed(false, s);
  }
  // Resolve is also gated: 3 clear ticks inside the cooldown produce nothing
  EXPECT_TRUE(deb_.triggered());

  EXPECT_EQ(feed(false, 64), AlertEvent::RESOLVED);
  EXPECT_FALSE(deb_.triggered());

  (void)feed(true, 70);
  (void)feed(true, 71);
  EXPECT_EQ(feed(true, 72), AlertEvent::NONE);
  EXPECT_EQ(feed(true, 125), AlertEvent::ALERT);
}

/* ----------------------------- Resolve Path ----------------------------- */

/** @test Resolve requires a prior trigger. */
TEST_F(AlertDebouncerTest, NoResolveWithoutTrigger) {
  for (int s = 1; s <= 10; ++s) {
    EXPECT_EQ(feed(false, s), AlertEvent::NONE);
  }
  EXPECT_EQ(deb_.phase(), AlertPhase::IDLE);
}

/** @test Resolve fires on the third clear tick after the cooldown. */
TEST_F(AlertDebouncerTest, ResolveOnThirdClearTick) {
  (void)feed(true, 1);
  (void)feed(true, 2);
  ASSERT_EQ(feed(true, 3), AlertEvent::ALERT);

  EXPECT_EQ(feed(false, 100), AlertEvent::NONE);
  EXPECT_EQ(deb_.phase(), AlertPhase::RESOLVE_RISING);
  EXPECT_EQ(feed(false, 101), AlertEvent::NONE);
  EXPECT_EQ(feed(false, 102), AlertEvent::RESOLVED);

  EXPECT_EQ(deb_.phase(), AlertPhase::IDLE);
  EXPECT_EQ(*deb_.lastNotifiedAt(), t0_ + 102s);
}

/** @test A breach in the middle of resolving restarts the clear count. */
TEST_F(AlertDebouncerTest, BreachInterruptsResolve) {
  (void)feed(true, 1);
  (void)feed(true, 2);
  ASSERT_EQ(feed(true, 3), AlertEvent::ALERT);

  (void)feed(false, 100);
  (void)feed(false, 101);
  EXPECT_EQ(feed(true, 102), AlertEvent::NONE);
  EXPECT_EQ(deb_.resolveCount(), 0U);
  EXPECT_EQ(deb_.phase(), AlertPhase::TRIGGERED);
  EXPECT_EQ(feed(false, 103), AlertEvent::NONE);
  EXPECT_TRUE(deb_.triggered());
}

/* ----------------------------- Cooldown ----------------------------- */

/** @test Elapsed time equal to the cooldown is not enough. */
TEST(AlertDebouncerCooldownTest, StrictlyGreaterThanCooldown) {
  using Clock = AlertDebouncer::Clock;
  AlertDebouncer deb(10s);
  const Clock::time_point T0 = Clock::time_point{} + 1h;

  (void)deb.update(true, T0);
  (void)deb.update(true, T0);
  ASSERT_EQ(deb.update(true, T0), AlertEvent::ALERT);

  (void)deb.update(false, T0 + 1s);
  (void)deb.update(false, T0 + 2s);
  EXPECT_EQ(deb.update(false, T0 + 10s), AlertEvent::NONE);
  EXPECT_EQ(deb.update(false, T0 + 10s + 1ms), AlertEvent::RESOLVED);
}

/** @test Zero cooldown only needs time to move forward. */
TEST(AlertDebouncerCooldownTest, ZeroCooldown) {
  using Clock = AlertDebouncer::Clock;
  AlertDebouncer deb(Clock::duration::zero());
  const Clock::time_point T0 = Clock::time_point{} + 1h;

  (void)deb.update(true, T0);
  (void)deb.update(true, T0 + 1s);
  EXPECT_EQ(deb.update(true, T0 + 2s), AlertEvent::ALERT);
  EXPECT_EQ(deb.update(true, T0 + 3s), AlertEvent::ALERT);
}

/* ----------------------------- Strings ----------------------------- */

/** @test Enum strings are stable. */
TEST(AlertDebouncerStringTest, ToString) {
  EXPECT_EQ(std::string(toString(AlertEvent::ALERT)), "ALERT");
  EXPECT_EQ(std::string(toString(AlertEvent::RESOLVED)), "RESOLVED");
  EXPECT_EQ(std::string(toString(AlertPhase::RESOLVE_RISING)), "RESOLVE_RISING");
}
