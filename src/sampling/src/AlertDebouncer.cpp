/**
 * @file AlertDebouncer.cpp
 * @brief Saturating breach/clear counters with cooldown-gated emission.
 */

#include "src/sampling/inc/AlertDebouncer.hpp"

namespace pulse {

namespace sampling {

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(AlertEvent event) noexcept {
  switch (event) {
  case AlertEvent::NONE:
    return "NONE";
  case AlertEvent::ALERT:
    return "ALERT";
  case AlertEvent::RESOLVED:
    return "RESOLVED";
  }
  return "UNKNOWN";
}

const char* toString(AlertPhase phase) noexcept {
  switch (phase) {
  case AlertPhase::IDLE:
    return "IDLE";
  case AlertPhase::ALERT_RISING:
    return "ALERT_RISING";
  case AlertPhase::TRIGGERED:
    return "TRIGGERED";
  case AlertPhase::RESOLVE_RISING:
    return "RESOLVE_RISING";
  }
  return "UNKNOWN";
}

/* ----------------------------- AlertDebouncer ----------------------------- */

AlertDebouncer::AlertDebouncer(Clock::duration cooldown) noexcept : cooldown_(cooldown) {}

AlertEvent AlertDebouncer::update(bool breach, Clock::time_point now) noexcept {
  if (breach) {
    if (alertCount_ < CONFIRM_TICKS) {
      ++alertCount_;
    }
    resolveCount_ = 0;
  } else {
    if (resolveCount_ < CONFIRM_TICKS) {
      ++resolveCount_;
    }
    alertCount_ = 0;
  }

  if (alertCount_ == CONFIRM_TICKS && cooledDown(now)) {
    triggered_ = true;
    lastNotifiedAt_ = now;
    return AlertEvent::ALERT;
  }
  if (triggered_ && resolveCount_ == CONFIRM_TICKS && cooledDown(now)) {
    triggered_ = false;
    lastNotifiedAt_ = now;
    return AlertEvent::RESOLVED;
  }
  return AlertEvent::NONE;
}

AlertPhase AlertDebouncer::phase() const noexcept {
  if (triggered_) {
    return (resolveCount_ > 0 && resolveCount_ < CONFIRM_TICKS) ? AlertPhase::RESOLVE_RISING
                                                                 : AlertPhase::TRIGGERED;
  }
  return (alertCount_ > 0) ? AlertPhase::ALERT_RISING : AlertPhase::IDLE;
}

bool AlertDebouncer::cooledDown(Clock::time_point now) const noexcept {
  if (!lastNotifiedAt_) {
    return true;
  }
  return (now - *lastNotifiedAt_) > cooldown_;
}

} // namespace sampling

} // namespace pulse
